#pragma once
#include "gitwire/hash.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

// Numbering follows the pack object header type field.
enum class ObjectType : std::uint8_t {
  Commit   = 1,
  Tree     = 2,
  Blob     = 3,
  Tag      = 4,
  OfsDelta = 6,
  RefDelta = 7,
};

[[nodiscard]] auto type_name(ObjectType type) -> std::string_view;
[[nodiscard]] auto type_from_name(std::string_view name) -> std::optional<ObjectType>;

struct Object {
  ObjectType type;                   // Commit | Tree | Blob | Tag
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

struct CommitInfo {
  std::string tree_hex;
  std::vector<std::string> parents; // zero or more parents (40-hex each)
  std::int64_t committer_time = 0;  // seconds since epoch, 0 when unparsable
};

struct TreeEntry {
  std::uint32_t mode; // 0100644 file, 040000 dir, 0160000 gitlink (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

struct TagInfo {
  std::string object_hex;
  std::optional<ObjectType> object_type;
  std::string tag_name;
};

// Parsers for object payloads. They throw std::runtime_error on corrupt data:
// objects come from the store, which is trusted.
[[nodiscard]] auto parse_commit(std::span<const std::uint8_t> data) -> CommitInfo;
[[nodiscard]] auto parse_tree(std::span<const std::uint8_t> data) -> std::vector<TreeEntry>;
[[nodiscard]] auto parse_tag(std::span<const std::uint8_t> data) -> TagInfo;

// Ids referenced by an object (tree+parents, entries, tag target); gitlinks
// are skipped because they live in another repository.
[[nodiscard]] auto referenced_ids(const Object &obj) -> std::vector<std::string>;

} // namespace gitwire
