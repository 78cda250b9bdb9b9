#include "gitwire/pack_format.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/util.hpp"

namespace gitwire::pack::format {

namespace {

void append_be32(std::vector<std::uint8_t> &out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

auto integrity_error(const std::string &msg) -> Status {
  return Status::error(ErrorKind::PackIntegrityError, msg);
}

} // namespace

void append_header(std::vector<std::uint8_t> &out, std::uint32_t object_count) {
  append(out, consts::kPackSignature);
  append_be32(out, consts::kPackVersion);
  append_be32(out, object_count);
}

void append_object_header(std::vector<std::uint8_t> &out, ObjectType type, std::uint64_t size) {
  auto byte = static_cast<std::uint8_t>((static_cast<unsigned>(type) << 4) | (size & 0x0f));
  size >>= 4;
  while (size != 0) {
    out.push_back(byte | 0x80);
    byte = size & 0x7f;
    size >>= 7;
  }
  out.push_back(byte);
}

void append_ofs_distance(std::vector<std::uint8_t> &out, std::uint64_t distance) {
  std::uint8_t buf[10];
  std::size_t pos = sizeof(buf) - 1;
  buf[pos] = distance & 0x7f;
  while (distance >>= 7) {
    --distance;
    buf[--pos] = static_cast<std::uint8_t>(0x80 | (distance & 0x7f));
  }
  out.insert(out.end(), buf + pos, buf + sizeof(buf));
}

Result<ObjectHeader> parse_object_header(std::span<const std::uint8_t> bytes) {
  if (bytes.empty())
    return integrity_error("truncated object header");
  std::uint8_t c = bytes[0];
  const unsigned type = (c >> 4) & 0x07;
  switch (type) {
  case 1:
  case 2:
  case 3:
  case 4:
  case 6:
  case 7:
    break;
  default:
    return integrity_error("invalid object type " + std::to_string(type));
  }

  std::uint64_t size = c & 0x0f;
  unsigned shift = 4;
  std::size_t i = 1;
  while (c & 0x80) {
    if (i >= bytes.size())
      return integrity_error("truncated object header");
    if (shift > 57)
      return integrity_error("object size overflows 64 bits");
    c = bytes[i++];
    size |= static_cast<std::uint64_t>(c & 0x7f) << shift;
    shift += 7;
  }
  return ObjectHeader{static_cast<ObjectType>(type), size, i};
}

Result<OfsDistance> parse_ofs_distance(std::span<const std::uint8_t> bytes) {
  if (bytes.empty())
    return integrity_error("truncated delta offset");
  std::uint8_t c = bytes[0];
  std::uint64_t distance = c & 0x7f;
  std::size_t i = 1;
  while (c & 0x80) {
    if (i >= bytes.size())
      return integrity_error("truncated delta offset");
    if (distance >> 56)
      return integrity_error("delta offset overflows 64 bits");
    c = bytes[i++];
    distance = ((distance + 1) << 7) | (c & 0x7f);
  }
  return OfsDistance{distance, i};
}

} // namespace gitwire::pack::format
