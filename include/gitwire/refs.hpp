#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitwire {

// One advertised ref. sha (and peeled, when present) are 40 lowercase hex.
struct RefLine {
  std::string sha;
  std::string name;
  std::optional<std::string> peeled; // target commit of an annotated tag

  friend bool operator==(const RefLine &, const RefLine &) = default;
};

// Read HEAD file as raw string (e.g., "ref: refs/heads/master\n" or a 40-hex id).
// Returns std::nullopt if HEAD does not exist.
std::optional<std::string> read_HEAD(const std::filesystem::path& git_dir);

// Target ref of a symbolic HEAD ("refs/heads/main"), nullopt when detached/missing.
std::optional<std::string> head_symref(const std::filesystem::path& git_dir);

// Read a ref (loose file first, then packed-refs) -> 40-hex OID.
std::optional<std::string> read_ref(const std::filesystem::path& git_dir, const std::string& refname);

struct PackedRef {
  std::string name;
  std::string sha;
  std::optional<std::string> peeled;
};

// Parse the packed-refs file (missing file -> empty).
std::vector<PackedRef> read_packed_refs(const std::filesystem::path& git_dir);

/**
 * Every ref under refs/ (loose overriding packed), sorted by name, with HEAD
 * first when it resolves. Peeled ids come from packed-refs only; callers that
 * can read objects fill in the rest.
 */
std::vector<RefLine> list_refs(const std::filesystem::path& git_dir);

} // namespace gitwire
