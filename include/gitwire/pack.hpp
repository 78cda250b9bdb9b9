#pragma once
#include "gitwire/error.hpp"
#include "gitwire/hash.hpp"
#include "gitwire/object.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

// Receives human-readable progress lines (side-band channel 2).
using ProgressSink = std::function<void(std::string_view)>;

namespace pack {

// One object to be written. Identity is the sha; the rest never changes.
struct PackableObject {
  std::string sha;
  ObjectType type = ObjectType::Blob; // never a delta type
  std::vector<std::uint8_t> data;
  std::optional<std::string> path;     // tree path the object was found at
  std::optional<std::int64_t> timestamp;
};

enum class OrderingStrategy : std::uint8_t {
  TypeFirst,      // commits, trees, blobs, tags
  SizeDescending, // largest first: best delta bases lead
  Recency,        // newest timestamp first
  PathBased,      // grouped by path
  DeltaOptimized, // bases strictly before their deltas
};

[[nodiscard]] auto to_string(OrderingStrategy s) -> std::string_view;
[[nodiscard]] auto ordering_from_string(std::string_view s) -> std::optional<OrderingStrategy>;

struct DeltaChainEntry {
  std::string object_sha;
  std::string base_sha;
  std::uint32_t depth = 0; // 1 for a delta against a full object
  std::size_t savings_bytes = 0;

  friend bool operator==(const DeltaChainEntry &, const DeltaChainEntry &) = default;
};

struct DeltaChainOptions {
  std::uint32_t max_depth = 50;
  std::size_t window = 10;
  std::uint32_t min_savings_percent = 10;
};

/**
 * Stable reorder. DeltaOptimized keeps the type/size grouping and then moves
 * every base named in `chains` ahead of the objects delta-encoded on it.
 */
std::vector<PackableObject> order_objects(std::vector<PackableObject> objects,
                                          OrderingStrategy strategy,
                                          const std::vector<DeltaChainEntry> &chains = {});

/**
 * Choose delta bases. Each object looks at up to `window` earlier objects of
 * its type (plus `external_bases` of its type, which are never written) and
 * keeps the candidate with the smallest delta, provided it saves more than
 * min_savings_percent of the object and the chain stays within max_depth.
 * A base that already depends on the object is never taken. Objects with no
 * entry are stored whole.
 */
std::vector<DeltaChainEntry> optimize_delta_chains(const std::vector<PackableObject> &objects,
                                                   const DeltaChainOptions &opts,
                                                   const std::vector<PackableObject> &external_bases = {},
                                                   std::stop_token stop = {});

struct PackOptions {
  OrderingStrategy ordering = OrderingStrategy::TypeFirst;
  bool use_deltas = true;
  bool ofs_delta = true; // false: every delta is a REF_DELTA
  DeltaChainOptions chains;
  int compression_level = 6;
  std::size_t batch_size = 256; // objects between cancellation checks

  // Thin pack: objects the client already has and that may serve as bases.
  // They are referenced by REF_DELTA and never written.
  std::vector<PackableObject> client_bases;

  ProgressSink progress;
  std::stop_token stop;
};

struct PackStats {
  std::uint32_t total_objects = 0;
  std::uint32_t delta_objects = 0;
  std::uint64_t uncompressed_size = 0;
  std::uint64_t compressed_size = 0;
  std::uint32_t max_delta_depth = 0;
};

struct PackfileResult {
  std::vector<std::uint8_t> bytes; // header + objects + trailer
  std::uint32_t object_count = 0;
  oid checksum{};                  // SHA-1 over everything before it
  std::vector<std::string> written; // object ids in pack order
  std::vector<DeltaChainEntry> chains;
  std::vector<std::string> missing_bases; // thin pack bases the client must have
  PackStats stats;
};

/**
 * Build a complete pack. Fails with Cancelled when `stop` fires (checked
 * between batches). Throws Error(PackIntegrityError) for an object whose id
 * does not match its content or whose type is a delta type, and
 * Error(DeltaError) if a computed delta does not reproduce its object.
 */
Result<PackfileResult> generate(std::vector<PackableObject> objects, const PackOptions &opts);

} // namespace pack

} // namespace gitwire
