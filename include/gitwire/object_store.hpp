#pragma once
#include "gitwire/hash.hpp"
#include "gitwire/object_source.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

/**
 * ObjectSource over an on-disk git directory. Reads zlib loose objects
 * (objects/xx/yyyy...), loose refs, packed-refs and HEAD. Never writes.
 */
class LooseObjectStore : public ObjectSource {
public:
  explicit LooseObjectStore(std::filesystem::path gitdir)
    : gitdir_(std::move(gitdir)) {}

  [[nodiscard]] const std::filesystem::path &git_dir() const { return gitdir_; }

  // Get filesystem path for a binary oid.
  std::filesystem::path path_for_oid(const oid& object_id) const;

  bool has_object(std::string_view sha) const override;
  // Throws std::runtime_error when the file exists but is not a valid object.
  std::optional<Object> get_object(std::string_view sha) const override;
  std::vector<RefLine> get_refs() const override;
  std::optional<std::string> head_symref() const override;

private:
  std::filesystem::path gitdir_;
};

// `path` itself when it is a git directory (bare repository), else path/.git.
std::optional<std::filesystem::path> resolve_git_dir(const std::filesystem::path& path);

} // namespace gitwire
