#include "gitwire/memory_store.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/error.hpp"
#include "gitwire/util.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <stdexcept>

namespace gitwire {

namespace {

auto mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

// git compares directory names as if they ended in '/'
auto tree_sort_key(const MemoryObjectStore::TreeItem &e) -> std::string {
  return e.mode == consts::kModeTree ? e.name + "/" : e.name;
}

auto signature(std::string_view who, std::int64_t time) -> std::string {
  return std::string(who) + " <" + std::string(who) + "@example.com> " + std::to_string(time) +
         " +0000";
}

} // namespace

std::string MemoryObjectStore::insert(ObjectType type, std::span<const std::uint8_t> data) {
  switch (type) {
  case ObjectType::Commit:
  case ObjectType::Tree:
  case ObjectType::Blob:
  case ObjectType::Tag:
    break;
  default:
    throw std::invalid_argument("memory store: cannot store delta objects");
  }
  auto id = object_id(type_name(type), data);
  objects_.try_emplace(id, Object{type, {data.begin(), data.end()}});
  return id;
}

std::string MemoryObjectStore::insert(ObjectType type, std::string_view data) {
  return insert(type, as_bytes(data));
}

std::string MemoryObjectStore::add_blob(std::string_view content) {
  return insert(ObjectType::Blob, content);
}

std::string MemoryObjectStore::add_tree(std::vector<TreeItem> entries) {
  std::ranges::sort(entries, [](const TreeItem &a, const TreeItem &b) {
    return tree_sort_key(a) < tree_sort_key(b);
  });

  std::string data;
  for (const auto &e : entries) {
    oid raw{};
    if (!from_hex(e.sha, raw)) {
      throw std::invalid_argument("memory store: bad tree entry id '" + e.sha + "'");
    }
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char *>(raw.data()), consts::kOidRawLen);
  }
  return insert(ObjectType::Tree, data);
}

std::string MemoryObjectStore::add_commit(std::string_view tree,
                                          const std::vector<std::string> &parents,
                                          std::int64_t time, std::string_view message) {
  std::string txt;
  txt += consts::kTreePrefix;
  txt += tree;
  txt += '\n';
  for (const auto &p : parents) {
    txt += consts::kParentPrefix;
    txt += p;
    txt += '\n';
  }
  txt += consts::kAuthorPrefix;
  txt += signature("author", time);
  txt += '\n';
  txt += consts::kCommitterPrefix;
  txt += signature("committer", time);
  txt += "\n\n";
  txt += message;
  return insert(ObjectType::Commit, txt);
}

std::string MemoryObjectStore::add_tag(std::string_view target, ObjectType target_type,
                                       std::string_view name, std::int64_t time) {
  std::string txt;
  txt += consts::kObjectPrefix;
  txt += target;
  txt += '\n';
  txt += consts::kTypePrefix;
  txt += type_name(target_type);
  txt += "\ntag ";
  txt += name;
  txt += '\n';
  txt += consts::kTaggerPrefix;
  txt += signature("tagger", time);
  txt += "\n\n";
  txt += name;
  txt += '\n';
  return insert(ObjectType::Tag, txt);
}

void MemoryObjectStore::set_ref(const std::string &name, const std::string &sha) {
  refs_[name] = lower_hex(sha);
}


void MemoryObjectStore::set_head(const std::string &target_ref) { head_ = target_ref; }

bool MemoryObjectStore::has_object(std::string_view sha) const {
  return objects_.contains(std::string(sha));
}

std::optional<Object> MemoryObjectStore::get_object(std::string_view sha) const {
  const auto it = objects_.find(std::string(sha));
  if (it == objects_.end())
    return std::nullopt;
  return it->second;
}

std::vector<RefLine> MemoryObjectStore::get_refs() const {
  std::vector<RefLine> out;
  if (head_) {
    const auto it = refs_.find(*head_);
    if (it != refs_.end()) {
      out.push_back(RefLine{it->second, std::string(consts::kHeadFile), std::nullopt});
    }
  }
  for (const auto &[name, sha] : refs_) {
    out.push_back(RefLine{sha, name, peel_tag(*this, sha)});
  }
  return out;
}

} // namespace gitwire
