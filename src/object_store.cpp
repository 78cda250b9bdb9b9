#include "gitwire/object_store.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/util.hpp"

#include <algorithm>
#include <stdexcept>

namespace gfs = gitwire::fs;

namespace gitwire {

std::filesystem::path LooseObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir = gitdir_ / consts::kObjectsDir / hex.substr(0, 2);
  return dir / hex.substr(2);
}

bool LooseObjectStore::has_object(std::string_view sha) const {
  oid id{};
  if (!from_hex(sha, id)) {
    return false;
  }
  return gfs::exists(path_for_oid(id));
}

std::optional<Object> LooseObjectStore::get_object(std::string_view sha) const {
  oid id{};
  if (!from_hex(sha, id)) {
    return std::nullopt;
  }
  const auto path = path_for_oid(id);
  if (!gfs::exists(path)) {
    return std::nullopt;
  }
  auto store = gfs::z_decompress(gfs::read_file(path));

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw std::runtime_error("object_store: invalid header in " + std::string(sha));
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw std::runtime_error("object_store: invalid header in " + std::string(sha));
  }
  const std::string type(store.begin(), it_space);
  const auto parsed = type_from_name(type);
  if (!parsed) {
    throw std::runtime_error("object_store: unknown type '" + type + "'");
  }
  const auto size = strutil::parse_u64(std::string(it_space + 1, it_nul));
  const std::size_t payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  if (!size || *size != store.size() - payload_off) {
    throw std::runtime_error("object_store: size mismatch in " + std::string(sha));
  }
  return Object{*parsed, {store.begin() + static_cast<std::ptrdiff_t>(payload_off), store.end()}};
}

std::vector<RefLine> LooseObjectStore::get_refs() const {
  auto refs = list_refs(gitdir_);
  for (auto &r : refs) {
    if (!r.peeled && std::string_view(r.name).starts_with("refs/tags/")) {
      r.peeled = peel_tag(*this, r.sha);
    }
  }
  return refs;
}

std::optional<std::string> LooseObjectStore::head_symref() const {
  return gitwire::head_symref(gitdir_);
}

std::optional<std::filesystem::path> resolve_git_dir(const std::filesystem::path &path) {
  const auto is_git_dir = [](const std::filesystem::path &p) {
    return std::filesystem::is_directory(p / consts::kObjectsDir) &&
           gfs::exists(p / consts::kHeadFile);
  };
  if (is_git_dir(path / ".git"))
    return path / ".git";
  if (is_git_dir(path))
    return path;
  return std::nullopt;
}

} // namespace gitwire
