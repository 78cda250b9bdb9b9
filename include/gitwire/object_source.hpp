#pragma once
#include "gitwire/object.hpp"
#include "gitwire/refs.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

/**
 * Read-only view of a repository; the only way the protocol engine touches
 * objects and refs. Ids are 40 lowercase hex. Nothing here creates or mutates
 * objects, so one source may serve many sessions at once as long as the
 * implementation tolerates concurrent readers.
 */
class ObjectSource {
public:
  virtual ~ObjectSource() = default;

  [[nodiscard]] virtual bool has_object(std::string_view sha) const = 0;
  [[nodiscard]] virtual std::optional<Object> get_object(std::string_view sha) const = 0;

  // Refs in advertisement order (HEAD first), peeled ids set for annotated tags.
  [[nodiscard]] virtual std::vector<RefLine> get_refs() const = 0;

  // Target of a symbolic HEAD ("refs/heads/main").
  [[nodiscard]] virtual std::optional<std::string> head_symref() const { return std::nullopt; }

  // Parents of a commit (empty for roots and non-commits).
  // Throws Error(ObjectNotFound) when the object is missing.
  [[nodiscard]] virtual std::vector<std::string> get_commit_parents(std::string_view sha) const;

  /**
   * Every object reachable from `sha`, itself included, in discovery order.
   * `depth` limits the commit generations followed (1 = only this commit's
   * tree). Throws Error(ObjectNotFound) on a dangling reference.
   */
  [[nodiscard]] virtual std::vector<std::string>
  get_reachable_objects(std::string_view sha,
                        std::optional<std::uint32_t> depth = std::nullopt) const;
};

// Follow annotated tags down to the first non-tag object; nullopt if `sha` is not a tag.
std::optional<std::string> peel_tag(const ObjectSource &src, std::string_view sha);

// Committer timestamp of a commit, 0 for non-commits.
std::int64_t commit_time(const ObjectSource &src, std::string_view sha);

} // namespace gitwire
