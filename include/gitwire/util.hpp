#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Strict form used on the wire and in RefLine: ^[0-9a-f]{40}$
auto is_sha1_hex(std::string_view str) -> bool;

// Lowercase copy of a 40-hex id (callers validate first)
auto lower_hex(std::string_view str) -> std::string;

// Byte helpers for text protocol lines
inline auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}
inline auto as_text(std::span<const std::uint8_t> b) -> std::string_view {
  return {reinterpret_cast<const char *>(b.data()), b.size()};
}
inline void append(std::vector<std::uint8_t> &out, std::span<const std::uint8_t> data) {
  out.insert(out.end(), data.begin(), data.end());
}
inline void append(std::vector<std::uint8_t> &out, std::string_view s) { append(out, as_bytes(s)); }

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);
  // View without one trailing LF (pkt-line payloads usually end in one)
  auto chomp(std::string_view str) -> std::string_view;
  // Trim spaces/tabs/CR on both ends
  auto trim(std::string_view str) -> std::string;
  // Split on runs of ASCII whitespace; no empty tokens
  auto split_ws(std::string_view str) -> std::vector<std::string_view>;
  // Non-negative decimal; nullopt on junk or overflow
  auto parse_u64(std::string_view str) -> std::optional<std::uint64_t>;
}

}
