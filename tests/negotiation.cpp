#include "gitwire/memory_store.hpp"
#include "gitwire/negotiation.hpp"

#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace gitwire;

namespace {

struct History {
  MemoryObjectStore store;
  std::vector<std::string> commits; // c1..c4, linear
  std::vector<std::string> trees;
  std::vector<std::string> blobs;
  std::string unrelated;
};

History make_history() {
  History h;
  std::string parent;
  for (int i = 1; i <= 4; ++i) {
    const auto blob = h.store.add_blob("version " + std::to_string(i) + "\n");
    const auto tree = h.store.add_tree({{0100644, "file.txt", blob}});
    std::vector<std::string> parents;
    if (!parent.empty())
      parents.push_back(parent);
    parent = h.store.add_commit(tree, parents, 1000 * i, "commit " + std::to_string(i) + "\n");
    h.blobs.push_back(blob);
    h.trees.push_back(tree);
    h.commits.push_back(parent);
  }
  const auto other = h.store.add_tree({{0100644, "other.txt", h.store.add_blob("elsewhere\n")}});
  h.unrelated = h.store.add_commit(other, {}, 500, "orphan\n");
  h.store.set_ref("refs/heads/main", h.commits[3]);
  h.store.set_ref("refs/heads/orphan", h.unrelated);
  h.store.set_head("refs/heads/main");
  return h;
}

std::set<std::string> as_set(const std::vector<std::string> &v) { return {v.begin(), v.end()}; }

} // namespace

int main() {
  const auto h = make_history();
  const auto &src = h.store;
  const auto &c = h.commits;

  // wants must exist
  {
    NegotiationSession s;
    const auto st = negotiation::process_wants(s, {std::string(40, 'f')}, src);
    if (st || st.kind != ErrorKind::NegotiationError || s.state != NegotiationState::Failed) {
      std::cerr << "unknown want accepted\n"; return 1;
    }
    NegotiationSession bad;
    if (negotiation::process_wants(bad, {"not-an-id"}, src)) { std::cerr << "malformed want accepted\n"; return 1; }
    NegotiationSession none;
    if (negotiation::process_wants(none, {}, src)) { std::cerr << "empty wants accepted\n"; return 1; }
    NegotiationSession early;
    const auto haves = negotiation::process_haves(early, {c[0]}, src, false);
    if (haves || haves.kind() != ErrorKind::NegotiationError) { std::cerr << "have before want\n"; return 1; }
  }

  // plain mode: ACK held back until done
  {
    NegotiationSession s;
    if (!negotiation::process_wants(s, {c[3]}, src) || s.state != NegotiationState::AwaitingHaves) {
      std::cerr << "process_wants\n"; return 1;
    }
    const auto round = negotiation::process_haves(s, {c[1]}, src, false);
    if (!round || !round.value().acks.empty() || round.value().nak || round.value().ready) {
      std::cerr << "plain round\n"; return 1;
    }
    const auto done = negotiation::process_haves(s, {}, src, true);
    if (!done || !done.value().ready || done.value().final_ack != Ack{c[1], AckStatus::None}) {
      std::cerr << "plain done\n"; return 1;
    }
    const auto sent = as_set(done.value().objects_to_send);
    const std::set<std::string> expect{c[3], c[2], h.trees[3], h.trees[2], h.blobs[3], h.blobs[2]};
    if (sent != expect || done.value().objects_to_send.front() != c[3]) { std::cerr << "plain objects\n"; return 1; }
    if (s.state != NegotiationState::Ready || !s.negotiation_complete) { std::cerr << "plain state\n"; return 1; }
    if (negotiation::process_haves(s, {c[0]}, src, true)) { std::cerr << "haves after ready accepted\n"; return 1; }
  }

  // plain mode without anything in common
  {
    NegotiationSession s;
    (void)negotiation::process_wants(s, {c[3]}, src);
    const auto round = negotiation::process_haves(s, {std::string(40, 'e')}, src, false);
    if (!round || !round.value().nak) { std::cerr << "NAK without common commits\n"; return 1; }
    const auto done = negotiation::process_haves(s, {}, src, true);
    if (!done || !done.value().nak || done.value().final_ack || done.value().objects_to_send.size() != 12) {
      std::cerr << "full clone\n"; return 1;
    }
  }

  // multi_ack: continue for each common have, unknown and unrelated haves ignored
  {
    NegotiationSession s;
    s.ack_mode = negotiation::ack_mode_for(true, false);
    (void)negotiation::process_wants(s, {c[3]}, src);
    const auto round = negotiation::process_haves(s, {h.unrelated, c[1], std::string(40, 'e')}, src, false);
    if (!round || round.value().acks != std::vector<Ack>{{c[1], AckStatus::Continue}} || !round.value().nak) {
      std::cerr << "multi_ack round\n"; return 1;
    }
    if (s.common_ancestors != std::vector<std::string>{c[1]}) { std::cerr << "common ancestors\n"; return 1; }
  }

  // multi_ack_detailed: common, then ready once every want is covered
  {
    NegotiationSession s;
    s.ack_mode = negotiation::ack_mode_for(true, true);
    (void)negotiation::process_wants(s, {c[3]}, src);
    const auto round = negotiation::process_haves(s, {c[2]}, src, false);
    const std::vector<Ack> expect{{c[2], AckStatus::Common}, {c[2], AckStatus::Ready}};
    if (!round || round.value().acks != expect || !round.value().nak || round.value().ready) {
      std::cerr << "detailed round\n"; return 1;
    }
    const auto done = negotiation::process_haves(s, {}, src, true);
    if (!done || done.value().final_ack != Ack{c[2], AckStatus::None} ||
        as_set(done.value().objects_to_send) != std::set<std::string>{c[3], h.trees[3], h.blobs[3]}) {
      std::cerr << "detailed done\n"; return 1;
    }
  }

  // no-done: the pack follows the ready round
  {
    NegotiationSession s;
    s.ack_mode = AckMode::MultiDetailed;
    s.no_done = true;
    (void)negotiation::process_wants(s, {c[3]}, src);
    const auto round = negotiation::process_haves(s, {c[0]}, src, false);
    if (!round || !round.value().ready || round.value().final_ack != Ack{c[0], AckStatus::None}) {
      std::cerr << "no-done\n"; return 1;
    }
  }

  // walks
  {
    const auto missing = negotiation::calculate_missing_objects(src, {c[3]}, {c[2]}, {});
    if (!missing || missing.value() != std::vector<std::string>{c[3], h.trees[3], h.blobs[3]}) {
      std::cerr << "missing objects\n"; return 1;
    }
    const auto bounded = negotiation::calculate_missing_objects(src, {c[3]}, {}, {c[2]});
    if (!bounded || bounded.value().size() != 6) { std::cerr << "boundary walk\n"; return 1; }
    const auto gone = negotiation::calculate_missing_objects(src, {std::string(40, 'e')}, {}, {});
    if (gone || gone.kind() != ErrorKind::ObjectNotFound) { std::cerr << "missing want object\n"; return 1; }

    if (!negotiation::is_ancestor(src, c[0], c[3]) || negotiation::is_ancestor(src, c[3], c[0]) ||
        negotiation::is_ancestor(src, h.unrelated, c[3]) || !negotiation::is_ancestor(src, c[2], c[2])) {
      std::cerr << "is_ancestor\n"; return 1;
    }
  }

  // wire lines
  {
    const Ack ack{c[1], AckStatus::Common};
    if (negotiation::format_ack(ack) != "ACK " + c[1] + " common\n") { std::cerr << "format_ack\n"; return 1; }
    const auto parsed = negotiation::parse_ack(negotiation::format_ack(ack));
    if (!parsed || parsed.value() != ack) { std::cerr << "parse_ack\n"; return 1; }
    const auto nak = negotiation::parse_ack(negotiation::format_nak());
    if (!nak || nak.value()) { std::cerr << "parse NAK\n"; return 1; }
    const auto bad = negotiation::parse_ack("ACK " + c[1] + " maybe\n");
    if (bad || bad.kind() != ErrorKind::NegotiationError) { std::cerr << "ACK status 'maybe' accepted\n"; return 1; }
    if (negotiation::format_shallow(c[0]) != "shallow " + c[0] + "\n" ||
        negotiation::format_unshallow(c[0]) != "unshallow " + c[0] + "\n") {
      std::cerr << "shallow lines\n"; return 1;
    }
  }

  std::cout << "negotiation OK\n";
  return 0;
}
