#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace gitwire::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// zlib stream (RFC 1950). level: 0-9, or -1 for zlib's default.
std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data, int level = -1);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

struct Inflated {
  std::vector<std::uint8_t> data;
  std::size_t consumed = 0; // input bytes belonging to the stream
};

// Inflate the single zlib stream at the front of `data`; trailing bytes are
// left alone. `size_hint` presizes the output. Throws on corrupt or truncated
// input.
Inflated z_inflate_prefix(std::span<const std::uint8_t> data, std::size_t size_hint = 0);

} // namespace gitwire::fs
