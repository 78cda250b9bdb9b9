// Utility helpers for hex and string handling
#include "gitwire/util.hpp"

#include "gitwire/consts.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace gitwire {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

bool is_sha1_hex(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str, [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

std::string lower_hex(std::string_view str) {
  std::string out(str);
  std::ranges::transform(out, out.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return out;
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string_view chomp(std::string_view s) {
  if (!s.empty() && s.back() == '\n')
    s.remove_suffix(1);
  return s;
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string_view> split_ws(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
      ++i;
    const std::size_t start = i;
    while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])))
      ++i;
    if (i > start)
      out.push_back(s.substr(start, i - start));
  }
  return out;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) {
  if (s.empty())
    return std::nullopt;
  std::uint64_t v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    return std::nullopt;
  return v;
}

} // namespace strutil

} // namespace gitwire
