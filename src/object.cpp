#include "gitwire/object.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/util.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace gitwire {

namespace {

auto ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  if (s.empty()) {
    throw std::runtime_error("tree parse: empty mode");
  }
  std::uint32_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '7') {
      throw std::runtime_error("tree parse: bad mode");
    }
    v = (v << 3) + static_cast<std::uint32_t>(c - '0');
  }
  return v;
}

// "Name <email> 1714412345 +0300" -> 1714412345
auto signature_time(std::string_view sig) -> std::int64_t {
  const auto gt = sig.rfind('>');
  if (gt == std::string_view::npos) {
    return 0;
  }
  const auto fields = strutil::split_ws(sig.substr(gt + 1));
  if (fields.empty()) {
    return 0;
  }
  const auto v = strutil::parse_u64(fields.front());
  return v ? static_cast<std::int64_t>(*v) : 0;
}

// Iterate header lines (up to the blank line that starts the message).
template <typename Fn> void for_each_header(std::span<const std::uint8_t> data, Fn &&fn) {
  const std::string_view text = as_text(data);
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string_view line =
        (nl == std::string_view::npos) ? text.substr(pos) : text.substr(pos, nl - pos);
    if (line.empty()) {
      break;
    }
    fn(line);
    if (nl == std::string_view::npos) {
      break;
    }
    pos = nl + 1;
  }
}

} // namespace

auto type_name(ObjectType type) -> std::string_view {
  switch (type) {
  case ObjectType::Commit:
    return consts::kTypeCommit;
  case ObjectType::Tree:
    return consts::kTypeTree;
  case ObjectType::Blob:
    return consts::kTypeBlob;
  case ObjectType::Tag:
    return consts::kTypeTag;
  case ObjectType::OfsDelta:
    return "ofs-delta";
  case ObjectType::RefDelta:
    return "ref-delta";
  }
  return "unknown";
}

auto type_from_name(std::string_view name) -> std::optional<ObjectType> {
  if (name == consts::kTypeCommit)
    return ObjectType::Commit;
  if (name == consts::kTypeTree)
    return ObjectType::Tree;
  if (name == consts::kTypeBlob)
    return ObjectType::Blob;
  if (name == consts::kTypeTag)
    return ObjectType::Tag;
  return std::nullopt;
}

auto parse_commit(std::span<const std::uint8_t> data) -> CommitInfo {
  CommitInfo info{};
  for_each_header(data, [&](std::string_view line) {
    if (line.starts_with(consts::kTreePrefix)) {
      info.tree_hex = std::string(line.substr(consts::kTreePrefix.size()));
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.emplace_back(line.substr(consts::kParentPrefix.size()));
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer_time = signature_time(line.substr(consts::kCommitterPrefix.size()));
    }
  });
  if (!looks_hex40(info.tree_hex)) {
    throw std::runtime_error("commit parse: missing tree");
  }
  for (const auto &p : info.parents) {
    if (!looks_hex40(p)) {
      throw std::runtime_error("commit parse: bad parent id");
    }
  }
  return info;
}

auto parse_tree(std::span<const std::uint8_t> data) -> std::vector<TreeEntry> {
  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw std::runtime_error("tree parse: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw std::runtime_error("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw std::runtime_error("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

auto parse_tag(std::span<const std::uint8_t> data) -> TagInfo {
  TagInfo info{};
  for_each_header(data, [&](std::string_view line) {
    if (line.starts_with(consts::kObjectPrefix)) {
      info.object_hex = std::string(line.substr(consts::kObjectPrefix.size()));
    } else if (line.starts_with(consts::kTypePrefix)) {
      info.object_type = type_from_name(line.substr(consts::kTypePrefix.size()));
    } else if (line.starts_with("tag ")) {
      info.tag_name = std::string(line.substr(4));
    }
  });
  if (!looks_hex40(info.object_hex)) {
    throw std::runtime_error("tag parse: missing object");
  }
  return info;
}

auto referenced_ids(const Object &obj) -> std::vector<std::string> {
  std::vector<std::string> out;
  switch (obj.type) {
  case ObjectType::Commit: {
    auto info = parse_commit(obj.data);
    out.push_back(lower_hex(info.tree_hex));
    for (const auto &p : info.parents)
      out.push_back(lower_hex(p));
    break;
  }
  case ObjectType::Tree:
    for (const auto &e : parse_tree(obj.data)) {
      if (e.mode == consts::kModeGitlink)
        continue;
      out.push_back(to_hex(e.id));
    }
    break;
  case ObjectType::Tag:
    out.push_back(lower_hex(parse_tag(obj.data).object_hex));
    break;
  default:
    break;
  }
  return out;
}

} // namespace gitwire
