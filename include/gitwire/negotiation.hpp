#pragma once
#include "gitwire/error.hpp"
#include "gitwire/object_source.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace gitwire {

enum class NegotiationState : std::uint8_t {
  AwaitingWants,
  AwaitingHaves,
  Negotiating,
  Ready, // pack may be sent
  Failed,
};

// multi_ack_detailed > multi_ack > plain
enum class AckMode : std::uint8_t { Single, Multi, MultiDetailed };

enum class AckStatus : std::uint8_t { None, Continue, Common, Ready };

struct Ack {
  std::string sha;
  AckStatus status = AckStatus::None;

  friend bool operator==(const Ack &, const Ack &) = default;
};

/**
 * Per-request negotiation state. Owned by exactly one request (stateless
 * HTTP) or connection (git://, ssh) and passed explicitly to the functions
 * below.
 */
struct NegotiationSession {
  NegotiationState state = NegotiationState::AwaitingWants;
  AckMode ack_mode = AckMode::Single;
  bool no_done = false;

  std::vector<std::string> wants; // request order, unique
  std::set<std::string> haves;
  std::vector<std::string> common_ancestors; // ACK order
  std::set<std::string> client_shallow;      // "shallow" lines from the client
  std::set<std::string> shallow_commits;     // boundary the pack walk stops at
  std::optional<std::uint32_t> depth;
  std::optional<std::int64_t> deepen_since;
  std::vector<std::string> deepen_not;
  bool negotiation_complete = false;

  std::stop_token stop;

  // Walk caches, filled lazily by process_haves.
  std::unordered_set<std::string> want_ancestry;
  bool want_ancestry_built = false;
  std::unordered_set<std::string> common_set;
  std::unordered_set<std::string> common_closure; // common commits and their ancestors
  std::unordered_set<std::string> unrelated; // commits known not to reach want_ancestry
  std::set<std::string> covered_wants;       // wants with a common ancestor
};

struct HavesResult {
  std::vector<Ack> acks;
  bool nak = false;                         // write "NAK" after the ACKs
  std::optional<Ack> final_ack;             // written last ("ACK <sha>")
  std::vector<std::string> objects_to_send; // set once ready
  bool ready = false;                       // negotiation finished, send the pack
};

struct ShallowResult {
  std::vector<std::string> new_shallow;
  std::vector<std::string> unshallow;
};

namespace negotiation {

// Chosen ACK mode from the client's capability entries.
AckMode ack_mode_for(bool multi_ack, bool multi_ack_detailed);

/**
 * Record the client's wants. Every id must be well formed and present in
 * the store, otherwise the session fails with NegotiationError and no pack
 * may be sent.
 */
Status process_wants(NegotiationSession &session, const std::vector<std::string> &wants,
                     const ObjectSource &src);

/**
 * One round of haves. A have becomes common when the store has it and it,
 * or one of its ancestors, is in the ancestry of a want. ACKs follow the
 * session's mode: multi_ack sends "continue", multi_ack_detailed sends
 * "common" and then "ready" once every want has a common ancestor, plain
 * mode holds its ACK until `client_done`. When done (or no-done and ready)
 * the final ACK/NAK is produced and objects_to_send is computed.
 */
Result<HavesResult> process_haves(NegotiationSession &session,
                                  const std::vector<std::string> &haves, const ObjectSource &src,
                                  bool client_done);

// True when every want has some common ancestor.
bool ok_to_give_up(NegotiationSession &session, const ObjectSource &src);

/**
 * Objects reachable from `wants` that are not reachable from `haves`.
 * Commit parents are not followed past `shallow_boundary`. Each object is
 * visited once. Result is in discovery order (commits before their trees).
 */
Result<std::vector<std::string>>
calculate_missing_objects(const ObjectSource &src, const std::vector<std::string> &wants,
                          const std::vector<std::string> &haves,
                          const std::set<std::string> &shallow_boundary,
                          std::stop_token stop = {});

/**
 * As above, but the walk from `haves` stops at `have_boundary` (the commits
 * the client holds without parents). Parents of have_boundary commits the
 * client reaches, and that are not in `shallow_boundary`, are walked as wants.
 */
Result<std::vector<std::string>>
calculate_missing_objects(const ObjectSource &src, const std::vector<std::string> &wants,
                          const std::vector<std::string> &haves,
                          const std::set<std::string> &shallow_boundary,
                          const std::set<std::string> &have_boundary,
                          std::stop_token stop = {});

/**
 * Compute the shallow boundary for a depth, deepen-since or deepen-not
 * request. Boundary commits not already shallow on the client are returned
 * as new_shallow; client-shallow commits now inside the history are
 * returned as unshallow. Updates session.shallow_commits.
 */
Result<ShallowResult> process_shallow(NegotiationSession &session, const ObjectSource &src,
                                      std::optional<std::uint32_t> depth,
                                      std::optional<std::int64_t> deepen_since,
                                      const std::vector<std::string> &deepen_not);

// ancestor == descendant counts as ancestry.
bool is_ancestor(const ObjectSource &src, std::string_view ancestor, std::string_view descendant);

// Wire lines
std::string format_ack(const Ack &ack);
std::string format_nak();
std::string format_shallow(std::string_view sha);
std::string format_unshallow(std::string_view sha);

// "ACK <sha>[ status]" -> Ack, "NAK" -> nullopt.
Result<std::optional<Ack>> parse_ack(std::string_view line);

} // namespace negotiation

} // namespace gitwire
