#include "gitwire/pack.hpp"

#include "gitwire/delta.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/pack_format.hpp"
#include "gitwire/util.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <unordered_set>

namespace gitwire::pack {

namespace {

constexpr std::array<std::pair<OrderingStrategy, std::string_view>, 5> kOrderingNames{{
    {OrderingStrategy::TypeFirst, "type-first"},
    {OrderingStrategy::SizeDescending, "size-descending"},
    {OrderingStrategy::Recency, "recency"},
    {OrderingStrategy::PathBased, "path-based"},
    {OrderingStrategy::DeltaOptimized, "delta-optimized"},
}};

auto type_rank(ObjectType t) -> int {
  switch (t) {
  case ObjectType::Commit:
    return 0;
  case ObjectType::Tree:
    return 1;
  case ObjectType::Blob:
    return 2;
  case ObjectType::Tag:
    return 3;
  default:
    return 4;
  }
}

auto type_first_less(const PackableObject &a, const PackableObject &b) -> bool {
  if (type_rank(a.type) != type_rank(b.type))
    return type_rank(a.type) < type_rank(b.type);
  if (a.path != b.path)
    return a.path < b.path;
  return a.data.size() > b.data.size();
}

// Bases before dependents, otherwise the incoming order.
auto topo_by_chains(std::vector<PackableObject> objects, const std::vector<DeltaChainEntry> &chains)
    -> std::vector<PackableObject> {
  std::unordered_map<std::string, std::string> base_of;
  for (const auto &c : chains)
    base_of.emplace(c.object_sha, c.base_sha);
  std::unordered_map<std::string, std::size_t> index;
  for (std::size_t i = 0; i < objects.size(); ++i)
    index.emplace(objects[i].sha, i);

  std::vector<PackableObject> out;
  out.reserve(objects.size());
  std::vector<std::uint8_t> mark(objects.size(), 0); // 0 new, 1 visiting, 2 placed

  for (std::size_t start = 0; start < objects.size(); ++start) {
    // collect the chain of unplaced bases, then place from the root down
    std::vector<std::size_t> path;
    std::size_t cur = start;
    while (mark[cur] == 0) {
      mark[cur] = 1;
      path.push_back(cur);
      const auto b = base_of.find(objects[cur].sha);
      if (b == base_of.end())
        break;
      const auto bi = index.find(b->second);
      if (bi == index.end())
        break; // external base
      cur = bi->second;
    }
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
      mark[*it] = 2;
      out.push_back(std::move(objects[*it]));
    }
  }
  return out;
}

struct Planned {
  DeltaChainEntry entry;
  std::vector<std::uint8_t> delta;
  bool external = false;
};

struct Candidate {
  const PackableObject *obj;
  std::uint32_t depth;
  bool external;
};

auto plan_deltas(const std::vector<PackableObject> &objects, const DeltaChainOptions &opts,
                 const std::vector<PackableObject> &client_bases, const std::stop_token &stop)
    -> std::vector<Planned> {
  // base ids end up in the pack as REF_DELTA names
  std::vector<PackableObject> external_bases = client_bases;
  for (auto &e : external_bases)
    e.sha = lower_hex(e.sha);

  std::vector<Planned> out;
  std::unordered_map<std::string, std::size_t> index;
  for (std::size_t i = 0; i < objects.size(); ++i)
    index.emplace(objects[i].sha, i);

  std::vector<std::uint32_t> depth(objects.size(), 0);
  std::vector<std::optional<std::size_t>> base_index(objects.size());

  // Does the chain below `j` already run through `i`?
  const auto depends_on = [&](std::size_t j, std::size_t i) {
    std::optional<std::size_t> cur = j;
    for (std::uint32_t hops = 0; cur && hops <= opts.max_depth + 1; ++hops) {
      if (*cur == i)
        return true;
      cur = base_index[*cur];
    }
    return false;
  };

  for (std::size_t i = 0; i < objects.size(); ++i) {
    if (stop.stop_requested())
      break;
    const auto &target = objects[i];
    if (target.data.empty())
      continue;

    std::vector<Candidate> candidates;
    std::size_t seen = 0;
    for (std::size_t j = i; j-- > 0 && seen < opts.window;) {
      if (objects[j].type != target.type)
        continue;
      ++seen;
      if (depth[j] >= opts.max_depth || depends_on(j, i))
        continue;
      candidates.push_back(Candidate{&objects[j], depth[j], false});
    }

    std::size_t ext_seen = 0;
    for (int pass = 0; pass < 2 && ext_seen < opts.window; ++pass) {
      for (const auto &e : external_bases) {
        if (ext_seen >= opts.window)
          break;
        if (e.type != target.type || index.contains(e.sha))
          continue;
        // same path first, then anything of the type
        const bool same_path = target.path && e.path == target.path;
        if ((pass == 0) != same_path)
          continue;
        ++ext_seen;
        candidates.push_back(Candidate{&e, 0, true});
      }
    }

    std::optional<Planned> best;
    for (const auto &c : candidates) {
      auto d = delta::create_delta(c.obj->data, target.data);
      if (d.size() >= target.data.size())
        continue;
      if (!best || d.size() < best->delta.size()) {
        best = Planned{DeltaChainEntry{target.sha, c.obj->sha, c.depth + 1,
                                       target.data.size() - d.size()},
                       std::move(d), c.external};
      }
    }
    if (!best)
      continue;
    if (best->entry.savings_bytes * 100 <=
        static_cast<std::size_t>(opts.min_savings_percent) * target.data.size()) {
      continue;
    }
    depth[i] = best->entry.depth;
    if (!best->external)
      base_index[i] = index.at(best->entry.base_sha);
    out.push_back(std::move(*best));
  }
  return out;
}

void check_object(const PackableObject &obj) {
  switch (obj.type) {
  case ObjectType::Commit:
  case ObjectType::Tree:
  case ObjectType::Blob:
  case ObjectType::Tag:
    break;
  default:
    throw Error(ErrorKind::PackIntegrityError, "cannot pack delta-typed object " + obj.sha);
  }
  if (object_id(type_name(obj.type), obj.data) != lower_hex(obj.sha)) {
    throw Error(ErrorKind::PackIntegrityError, "object id does not match content: " + obj.sha);
  }
}

void report(const ProgressSink &sink, const std::string &msg) {
  if (sink)
    sink(msg);
}

} // namespace

std::string_view to_string(OrderingStrategy s) {
  for (const auto &[k, name] : kOrderingNames) {
    if (k == s)
      return name;
  }
  return {};
}

std::optional<OrderingStrategy> ordering_from_string(std::string_view s) {
  for (const auto &[k, name] : kOrderingNames) {
    if (name == s)
      return k;
  }
  return std::nullopt;
}

std::vector<PackableObject> order_objects(std::vector<PackableObject> objects,
                                          OrderingStrategy strategy,
                                          const std::vector<DeltaChainEntry> &chains) {
  switch (strategy) {
  case OrderingStrategy::TypeFirst:
    std::ranges::stable_sort(objects, type_first_less);
    break;
  case OrderingStrategy::SizeDescending:
    std::ranges::stable_sort(objects, [](const PackableObject &a, const PackableObject &b) {
      return a.data.size() > b.data.size();
    });
    break;
  case OrderingStrategy::Recency:
    std::ranges::stable_sort(objects, [](const PackableObject &a, const PackableObject &b) {
      // objects without a timestamp go last
      if (a.timestamp.has_value() != b.timestamp.has_value())
        return a.timestamp.has_value();
      return a.timestamp.value_or(0) > b.timestamp.value_or(0);
    });
    break;
  case OrderingStrategy::PathBased:
    std::ranges::stable_sort(objects, [](const PackableObject &a, const PackableObject &b) {
      if (a.path.has_value() != b.path.has_value())
        return a.path.has_value();
      if (a.path != b.path)
        return a.path < b.path;
      return type_first_less(a, b);
    });
    break;
  case OrderingStrategy::DeltaOptimized:
    std::ranges::stable_sort(objects, type_first_less);
    objects = topo_by_chains(std::move(objects), chains);
    break;
  }
  return objects;
}

std::vector<DeltaChainEntry> optimize_delta_chains(const std::vector<PackableObject> &objects,
                                                   const DeltaChainOptions &opts,
                                                   const std::vector<PackableObject> &external_bases,
                                                   std::stop_token stop) {
  std::vector<DeltaChainEntry> out;
  for (auto &p : plan_deltas(objects, opts, external_bases, stop))
    out.push_back(std::move(p.entry));
  return out;
}

Result<PackfileResult> generate(std::vector<PackableObject> objects, const PackOptions &opts) {
  const auto cancelled = [] {
    return Status::error(ErrorKind::Cancelled, "pack generation cancelled");
  };

  std::unordered_set<std::string> unique;
  std::vector<PackableObject> input;
  input.reserve(objects.size());
  for (auto &obj : objects) {
    check_object(obj);
    obj.sha = lower_hex(obj.sha);
    if (unique.insert(obj.sha).second)
      input.push_back(std::move(obj));
  }

  const bool topo = opts.ordering == OrderingStrategy::DeltaOptimized;
  auto ordered = order_objects(std::move(input), topo ? OrderingStrategy::TypeFirst : opts.ordering);

  std::vector<Planned> planned;
  if (opts.use_deltas) {
    planned = plan_deltas(ordered, opts.chains, opts.client_bases, opts.stop);
    if (opts.stop.stop_requested())
      return cancelled();
  }

  PackfileResult res;
  for (const auto &p : planned)
    res.chains.push_back(p.entry);
  if (topo)
    ordered = order_objects(std::move(ordered), OrderingStrategy::DeltaOptimized, res.chains);

  if (opts.use_deltas) {
    report(opts.progress, "Compressing objects: 100% (" + std::to_string(planned.size()) + "/" +
                              std::to_string(planned.size()) + "), done.\n");
  }

  std::unordered_map<std::string, const Planned *> plan_of;
  for (const auto &p : planned)
    plan_of.emplace(p.entry.object_sha, &p);
  std::unordered_map<std::string, const std::vector<std::uint8_t> *> data_of;
  for (const auto &o : ordered)
    data_of.emplace(o.sha, &o.data);
  for (const auto &o : opts.client_bases)
    data_of.emplace(lower_hex(o.sha), &o.data);

  auto &out = res.bytes;
  format::append_header(out, static_cast<std::uint32_t>(ordered.size()));

  Sha1 hasher;
  std::size_t hashed = 0;
  std::unordered_map<std::string, std::uint64_t> offset_of;
  std::unordered_set<std::string> missing;
  const std::size_t batch = std::max<std::size_t>(opts.batch_size, 1);

  for (std::size_t i = 0; i < ordered.size(); ++i) {
    if (i % batch == 0) {
      if (opts.stop.stop_requested())
        return cancelled();
      hasher.update(std::span(out).subspan(hashed));
      hashed = out.size();
    }

    const auto &obj = ordered[i];
    const std::uint64_t offset = out.size();
    std::span<const std::uint8_t> payload = obj.data;

    const auto pit = plan_of.find(obj.sha);
    if (pit != plan_of.end()) {
      const Planned &p = *pit->second;
      const auto rebuilt = delta::apply_delta(*data_of.at(p.entry.base_sha), p.delta);
      if (!rebuilt || rebuilt.value() != obj.data) {
        throw Error(ErrorKind::DeltaError, "delta for " + obj.sha + " does not reproduce it");
      }

      const auto base_off = offset_of.find(p.entry.base_sha);
      if (opts.ofs_delta && !p.external && base_off != offset_of.end()) {
        format::append_object_header(out, ObjectType::OfsDelta, p.delta.size());
        format::append_ofs_distance(out, offset - base_off->second);
      } else {
        oid raw{};
        if (!from_hex(p.entry.base_sha, raw)) {
          throw Error(ErrorKind::PackIntegrityError, "bad base id " + p.entry.base_sha);
        }
        format::append_object_header(out, ObjectType::RefDelta, p.delta.size());
        out.insert(out.end(), raw.begin(), raw.end());
      }
      if (p.external && missing.insert(p.entry.base_sha).second)
        res.missing_bases.push_back(p.entry.base_sha);

      payload = p.delta;
      ++res.stats.delta_objects;
      res.stats.max_delta_depth = std::max(res.stats.max_delta_depth, p.entry.depth);
    } else {
      format::append_object_header(out, obj.type, obj.data.size());
    }

    const auto compressed = fs::z_compress(payload, opts.compression_level);
    out.insert(out.end(), compressed.begin(), compressed.end());
    offset_of.emplace(obj.sha, offset);
    res.written.push_back(obj.sha);
    res.stats.uncompressed_size += obj.data.size();
    res.stats.compressed_size += compressed.size();
  }

  hasher.update(std::span(out).subspan(hashed));
  res.checksum = hasher.finish();
  out.insert(out.end(), res.checksum.begin(), res.checksum.end());

  res.object_count = static_cast<std::uint32_t>(ordered.size());
  res.stats.total_objects = res.object_count;
  report(opts.progress, "Total " + std::to_string(res.object_count) + " (delta " +
                            std::to_string(res.stats.delta_objects) +
                            "), reused 0 (delta 0)\n");
  return res;
}

} // namespace gitwire::pack
