#include "gitwire/object_source.hpp"

#include "gitwire/error.hpp"
#include "gitwire/util.hpp"

#include <deque>
#include <unordered_set>
#include <utility>

namespace gitwire {

namespace {

auto must_get(const ObjectSource &src, std::string_view sha) -> Object {
  auto obj = src.get_object(sha);
  if (!obj) {
    throw Error(ErrorKind::ObjectNotFound, "missing object " + std::string(sha));
  }
  return std::move(*obj);
}

} // namespace

std::vector<std::string> ObjectSource::get_commit_parents(std::string_view sha) const {
  const auto obj = must_get(*this, sha);
  if (obj.type != ObjectType::Commit) {
    return {};
  }
  auto info = parse_commit(obj.data);
  std::vector<std::string> out;
  out.reserve(info.parents.size());
  for (const auto &p : info.parents)
    out.push_back(lower_hex(p));
  return out;
}

std::vector<std::string>
ObjectSource::get_reachable_objects(std::string_view sha,
                                    std::optional<std::uint32_t> depth) const {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  // (id, commit generation); breadth first so a commit is first met at its
  // smallest generation
  std::deque<std::pair<std::string, std::uint32_t>> queue;
  queue.emplace_back(lower_hex(sha), 1);

  while (!queue.empty()) {
    auto [cur, gen] = std::move(queue.front());
    queue.pop_front();
    if (!seen.insert(cur).second)
      continue;

    const auto obj = must_get(*this, cur);
    out.push_back(cur);

    if (obj.type == ObjectType::Commit) {
      const auto info = parse_commit(obj.data);
      queue.emplace_back(lower_hex(info.tree_hex), gen);
      if (!depth || gen < *depth) {
        for (const auto &p : info.parents)
          queue.emplace_back(lower_hex(p), gen + 1);
      }
      continue;
    }
    for (auto &id : referenced_ids(obj)) {
      if (!seen.contains(id))
        queue.emplace_back(std::move(id), gen);
    }
  }
  return out;
}

std::optional<std::string> peel_tag(const ObjectSource &src, std::string_view sha) {
  std::string cur = lower_hex(sha);
  bool peeled = false;
  // tag chains are short; the bound only guards against a tag cycle
  for (int hops = 0; hops < 64; ++hops) {
    const auto obj = src.get_object(cur);
    if (!obj || obj->type != ObjectType::Tag) {
      break;
    }
    cur = lower_hex(parse_tag(obj->data).object_hex);
    peeled = true;
  }
  if (!peeled)
    return std::nullopt;
  return cur;
}

std::int64_t commit_time(const ObjectSource &src, std::string_view sha) {
  const auto obj = src.get_object(sha);
  if (!obj || obj->type != ObjectType::Commit) {
    return 0;
  }
  return parse_commit(obj->data).committer_time;
}

} // namespace gitwire
