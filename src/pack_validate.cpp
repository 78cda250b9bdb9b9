#include "gitwire/pack_validate.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/delta.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/pack_format.hpp"
#include "gitwire/util.hpp"

#include <algorithm>
#include <cstring>
#include <unordered_map>
#include <unordered_set>

namespace gitwire::pack {

namespace {

struct Entry {
  std::uint64_t offset = 0;
  ObjectType type = ObjectType::Blob;
  std::vector<std::uint8_t> data; // inflated payload
  std::uint64_t base_offset = 0;  // OfsDelta
  std::string base_sha;           // RefDelta
};

enum class State : std::uint8_t { Pending, Done, Failed };

struct Resolved {
  State state = State::Pending;
  ObjectType type = ObjectType::Blob;
  std::vector<std::uint8_t> data;
  std::uint32_t depth = 0;
  std::string id;
};

auto read_be32(std::span<const std::uint8_t> b) -> std::uint32_t {
  return (std::uint32_t{b[0]} << 24) | (std::uint32_t{b[1]} << 16) | (std::uint32_t{b[2]} << 8) |
         std::uint32_t{b[3]};
}

auto where(std::uint64_t offset) -> std::string {
  return "entry at offset " + std::to_string(offset) + ": ";
}

// Parse every entry; stops at the first one that cannot be read.
auto read_entries(std::span<const std::uint8_t> body, std::uint32_t declared, ValidationResult &res)
    -> std::vector<Entry> {
  std::vector<Entry> entries;
  std::size_t pos = consts::kPackHeaderLen;
  const std::size_t end = body.size();

  for (std::uint32_t i = 0; i < declared; ++i) {
    if (pos >= end) {
      res.errors.push_back("pack ends after " + std::to_string(i) + " of " +
                           std::to_string(declared) + " objects");
      return entries;
    }
    Entry e;
    e.offset = pos;
    const auto hdr = format::parse_object_header(body.subspan(pos));
    if (!hdr) {
      res.errors.push_back(where(pos) + hdr.status().message);
      return entries;
    }
    e.type = hdr.value().type;
    std::size_t cur = pos + hdr.value().length;

    if (e.type == ObjectType::OfsDelta) {
      const auto dist = format::parse_ofs_distance(body.subspan(cur));
      if (!dist) {
        res.errors.push_back(where(pos) + dist.status().message);
        return entries;
      }
      if (dist.value().distance == 0 || dist.value().distance > pos) {
        res.errors.push_back(where(pos) + "delta base offset out of range");
        return entries;
      }
      e.base_offset = pos - dist.value().distance;
      cur += dist.value().length;
    } else if (e.type == ObjectType::RefDelta) {
      if (end - cur < consts::kOidRawLen) {
        res.errors.push_back(where(pos) + "truncated delta base id");
        return entries;
      }
      oid raw{};
      std::memcpy(raw.data(), body.data() + cur, raw.size());
      e.base_sha = to_hex(raw);
      cur += consts::kOidRawLen;
    }

    try {
      const auto hint = std::min<std::uint64_t>(hdr.value().size, std::uint64_t{1} << 24);
      auto inflated = fs::z_inflate_prefix(body.subspan(cur), static_cast<std::size_t>(hint));
      if (inflated.data.size() != hdr.value().size) {
        res.errors.push_back(where(pos) + "inflated to " + std::to_string(inflated.data.size()) +
                             " bytes, header says " + std::to_string(hdr.value().size));
        return entries;
      }
      e.data = std::move(inflated.data);
      cur += inflated.consumed;
    } catch (const std::runtime_error &ex) {
      res.errors.push_back(where(pos) + ex.what());
      return entries;
    }

    entries.push_back(std::move(e));
    pos = cur;
  }

  if (pos != end)
    res.errors.push_back(std::to_string(end - pos) + " unexpected bytes after the last object");
  return entries;
}

void resolve_chains(const std::vector<Entry> &entries, const ValidateOptions &opts,
                    ValidationResult &res) {
  std::vector<Resolved> out(entries.size());
  std::unordered_map<std::uint64_t, std::size_t> by_offset;
  for (std::size_t i = 0; i < entries.size(); ++i)
    by_offset.emplace(entries[i].offset, i);
  std::unordered_map<std::string, std::size_t> by_id;
  std::unordered_map<std::string, const PackableObject *> external;
  for (const auto &b : opts.external_bases)
    external.emplace(lower_hex(b.sha), &b);

  const auto finish = [&](std::size_t i, ObjectType type, std::vector<std::uint8_t> data,
                          std::uint32_t depth) {
    auto &r = out[i];
    r.state = State::Done;
    r.type = type;
    r.data = std::move(data);
    r.depth = depth;
    r.id = object_id(type_name(type), r.data);
    by_id.emplace(r.id, i);
  };

  const auto apply = [&](std::size_t i, ObjectType base_type,
                         std::span<const std::uint8_t> base, std::uint32_t base_depth) {
    auto target = delta::apply_delta(base, entries[i].data);
    if (!target) {
      out[i].state = State::Failed;
      res.errors.push_back(where(entries[i].offset) + target.status().message);
      return;
    }
    finish(i, base_type, std::move(target).value(), base_depth + 1);
  };

  // Bases may come later in the pack (REF_DELTA), so sweep until nothing moves.
  bool progress = true;
  while (progress) {
    progress = false;
    for (std::size_t i = 0; i < entries.size(); ++i) {
      if (out[i].state != State::Pending)
        continue;
      const auto &e = entries[i];

      if (e.type != ObjectType::OfsDelta && e.type != ObjectType::RefDelta) {
        finish(i, e.type, e.data, 0);
        progress = true;
        continue;
      }

      std::optional<std::size_t> base;
      if (e.type == ObjectType::OfsDelta) {
        const auto it = by_offset.find(e.base_offset);
        if (it == by_offset.end()) {
          out[i].state = State::Failed;
          res.errors.push_back(where(e.offset) + "delta base is not an entry start");
          progress = true;
          continue;
        }
        base = it->second;
      } else if (const auto it = by_id.find(e.base_sha); it != by_id.end()) {
        base = it->second;
      }

      if (base) {
        const auto &b = out[*base];
        if (b.state == State::Failed) {
          out[i].state = State::Failed;
          res.errors.push_back(where(e.offset) + "delta base could not be resolved");
          progress = true;
        } else if (b.state == State::Done) {
          apply(i, b.type, b.data, b.depth);
          progress = true;
        }
        continue;
      }
      if (const auto ext = external.find(e.base_sha); ext != external.end()) {
        apply(i, ext->second->type, ext->second->data, 0);
        progress = true;
      }
    }
  }

  std::unordered_set<std::string> unresolved;
  std::uint64_t depth_sum = 0;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto &r = out[i];
    if (r.state == State::Pending) {
      if (entries[i].type == ObjectType::RefDelta) {
        if (unresolved.insert(entries[i].base_sha).second)
          res.unresolved_bases.push_back(entries[i].base_sha);
      } else {
        res.errors.push_back(where(entries[i].offset) + "delta chain never reaches a base");
      }
      continue;
    }
    if (r.state != State::Done)
      continue;
    res.object_ids.push_back(r.id);
    if (r.depth > 0) {
      ++res.chains.chain_count;
      res.chains.max_depth = std::max(res.chains.max_depth, r.depth);
      depth_sum += r.depth;
    }
  }
  if (res.chains.chain_count > 0) {
    res.chains.average_depth =
        static_cast<double>(depth_sum) / static_cast<double>(res.chains.chain_count);
  }
}

} // namespace

ValidationResult validate_pack_integrity(std::span<const std::uint8_t> bytes,
                                         const ValidateOptions &opts) {
  ValidationResult res;
  if (bytes.size() < consts::kPackHeaderLen + consts::kPackTrailerLen) {
    res.errors.push_back("pack too short: " + std::to_string(bytes.size()) + " bytes");
    return res;
  }

  const auto sig = as_text(bytes.first(4));
  const auto version = read_be32(bytes.subspan(4, 4));
  res.declared_objects = read_be32(bytes.subspan(8, 4));
  res.header_valid = sig == consts::kPackSignature && (version == 2 || version == 3);
  if (sig != consts::kPackSignature)
    res.errors.push_back("bad pack signature");
  else if (!res.header_valid)
    res.errors.push_back("unsupported pack version " + std::to_string(version));

  const auto body = bytes.first(bytes.size() - consts::kPackTrailerLen);
  const auto trailer = bytes.last(consts::kPackTrailerLen);
  const oid sum = sha1(body);
  res.checksum_valid = std::equal(sum.begin(), sum.end(), trailer.begin());
  if (!res.checksum_valid)
    res.errors.push_back("pack checksum mismatch");

  if (res.header_valid) {
    const auto entries = read_entries(body, res.declared_objects, res);
    res.parsed_objects = static_cast<std::uint32_t>(entries.size());
    if (opts.walk_deltas) {
      resolve_chains(entries, opts, res);
    } else {
      for (const auto &e : entries) {
        if (e.type != ObjectType::OfsDelta && e.type != ObjectType::RefDelta)
          res.object_ids.push_back(object_id(type_name(e.type), e.data));
      }
    }
  }

  res.valid = res.errors.empty();
  return res;
}

} // namespace gitwire::pack
