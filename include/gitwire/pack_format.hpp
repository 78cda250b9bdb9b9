#pragma once
#include "gitwire/error.hpp"
#include "gitwire/object.hpp"

#include <cstdint>
#include <span>
#include <vector>

// Byte-level pieces of the pack v2 format shared by the writer and the validator.
namespace gitwire::pack::format {

// "PACK", version, object count (both big-endian)
void append_header(std::vector<std::uint8_t> &out, std::uint32_t object_count);

// Type in bits 4-6 of the first byte, size as 4 + 7*k little-endian bits.
void append_object_header(std::vector<std::uint8_t> &out, ObjectType type, std::uint64_t size);

// OFS_DELTA distance: big-endian 7-bit groups, each continuation adds one.
void append_ofs_distance(std::vector<std::uint8_t> &out, std::uint64_t distance);

struct ObjectHeader {
  ObjectType type;
  std::uint64_t size = 0;  // inflated size of the entry payload
  std::size_t length = 0;  // bytes used by the header
};

Result<ObjectHeader> parse_object_header(std::span<const std::uint8_t> bytes);

struct OfsDistance {
  std::uint64_t distance = 0;
  std::size_t length = 0;
};

Result<OfsDistance> parse_ofs_distance(std::span<const std::uint8_t> bytes);

} // namespace gitwire::pack::format
