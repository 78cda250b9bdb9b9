#pragma once
#include "gitwire/object_source.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gitwire {

// In-memory ObjectSource. Ids are real Git ids, so packs built from it are
// readable by git itself.
class MemoryObjectStore : public ObjectSource {
public:
  struct TreeItem {
    std::uint32_t mode; // consts::kModeTree for subdirectories
    std::string name;
    std::string sha;
  };

  // Store an object and return its id; storing the same content twice is a no-op.
  std::string insert(ObjectType type, std::span<const std::uint8_t> data);
  std::string insert(ObjectType type, std::string_view data);

  std::string add_blob(std::string_view content);
  // Entries are sorted the way git sorts trees.
  std::string add_tree(std::vector<TreeItem> entries);
  std::string add_commit(std::string_view tree, const std::vector<std::string> &parents,
                         std::int64_t time, std::string_view message);
  std::string add_tag(std::string_view target, ObjectType target_type, std::string_view name,
                      std::int64_t time = 0);

  void set_ref(const std::string &name, const std::string &sha);
  // Make HEAD a symbolic ref to `target_ref`.
  void set_head(const std::string &target_ref);

  [[nodiscard]] auto size() const -> std::size_t { return objects_.size(); }

  bool has_object(std::string_view sha) const override;
  std::optional<Object> get_object(std::string_view sha) const override;
  std::vector<RefLine> get_refs() const override;
  std::optional<std::string> head_symref() const override { return head_; }

private:
  std::unordered_map<std::string, Object> objects_;
  std::map<std::string, std::string> refs_;
  std::optional<std::string> head_;
};

} // namespace gitwire
