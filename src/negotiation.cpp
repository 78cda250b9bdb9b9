#include "gitwire/negotiation.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/util.hpp"

#include <algorithm>
#include <deque>
#include <utility>

namespace gitwire::negotiation {

namespace {

auto cancelled() -> Status { return Status::error(ErrorKind::Cancelled, "negotiation cancelled"); }

auto fail(NegotiationSession &session, Status st) -> Status {
  session.state = NegotiationState::Failed;
  return st;
}

// Commit id behind `sha` (tags peeled); nullopt for trees, blobs and unknown ids.
auto commit_of(const ObjectSource &src, std::string_view sha) -> std::optional<std::string> {
  std::string cur = lower_hex(sha);
  if (auto peeled = peel_tag(src, cur))
    cur = std::move(*peeled);
  const auto obj = src.get_object(cur);
  if (!obj || obj->type != ObjectType::Commit)
    return std::nullopt;
  return cur;
}

// Add every ancestor of `start` (itself included) to `into`. Stops at ids
// already present, so repeated calls only walk new history.
auto mark_ancestry(const ObjectSource &src, const std::string &start,
                   std::unordered_set<std::string> &into, const std::stop_token &stop) -> Status {
  std::vector<std::string> stack{start};
  while (!stack.empty()) {
    if (stop.stop_requested())
      return cancelled();
    auto cur = std::move(stack.back());
    stack.pop_back();
    if (!into.insert(cur).second)
      continue;
    for (auto &p : src.get_commit_parents(cur))
      stack.push_back(std::move(p));
  }
  return Status::ok();
}

auto build_want_ancestry(NegotiationSession &session, const ObjectSource &src) -> Status {
  if (session.want_ancestry_built)
    return Status::ok();
  for (const auto &w : session.wants) {
    if (auto c = commit_of(src, w)) {
      if (auto st = mark_ancestry(src, *c, session.want_ancestry, session.stop); !st)
        return st;
    }
  }
  session.want_ancestry_built = true;
  return Status::ok();
}

// Does `commit` or one of its ancestors belong to the ancestry of a want?
auto reaches_want_ancestry(NegotiationSession &session, const ObjectSource &src,
                           const std::string &commit) -> Result<bool> {
  std::vector<std::string> stack{commit};
  std::unordered_set<std::string> seen;
  while (!stack.empty()) {
    if (session.stop.stop_requested())
      return cancelled();
    auto cur = std::move(stack.back());
    stack.pop_back();
    if (session.want_ancestry.contains(cur))
      return true;
    if (session.unrelated.contains(cur) || !seen.insert(cur).second)
      continue;
    for (auto &p : src.get_commit_parents(cur))
      stack.push_back(std::move(p));
  }
  session.unrelated.insert(seen.begin(), seen.end());
  return false;
}

auto status_word(AckStatus s) -> std::string_view {
  switch (s) {
  case AckStatus::Continue:
    return "continue";
  case AckStatus::Common:
    return "common";
  case AckStatus::Ready:
    return "ready";
  case AckStatus::None:
    break;
  }
  return {};
}

/**
 * Depth-first walk over commits, trees, blobs and tags.
 * Ids in `skip` (and everything only reachable through them) are left out;
 * commits in `boundary` keep their tree but not their parents. With
 * `order` set, newly visited ids are appended to it and a missing object is
 * an error; without it, missing objects are ignored (client-side ids).
 */
auto walk_objects(const ObjectSource &src, const std::vector<std::string> &roots,
                  std::unordered_set<std::string> &seen,
                  const std::unordered_set<std::string> *skip,
                  const std::set<std::string> &boundary, const std::stop_token &stop,
                  std::vector<std::string> *order) -> Status {
  std::vector<std::string> stack(roots.rbegin(), roots.rend());
  while (!stack.empty()) {
    if (stop.stop_requested())
      return cancelled();
    auto cur = std::move(stack.back());
    stack.pop_back();
    if ((skip && skip->contains(cur)) || seen.contains(cur))
      continue;

    const auto obj = src.get_object(cur);
    if (!obj) {
      if (order) {
        return Status::error(ErrorKind::ObjectNotFound, "missing object " + cur);
      }
      continue;
    }
    seen.insert(cur);
    if (order)
      order->push_back(cur);

    std::vector<std::string> next;
    if (obj->type == ObjectType::Commit) {
      auto info = parse_commit(obj->data);
      next.push_back(lower_hex(info.tree_hex));
      if (!boundary.contains(cur)) {
        for (const auto &p : info.parents)
          next.push_back(lower_hex(p));
      }
    } else {
      next = referenced_ids(*obj);
    }
    for (auto it = next.rbegin(); it != next.rend(); ++it) {
      if (!seen.contains(*it))
        stack.push_back(std::move(*it));
    }
  }
  return Status::ok();
}

auto resolve_ref(const std::vector<RefLine> &refs, std::string_view name)
    -> std::optional<std::string> {
  for (const auto &r : refs) {
    if (r.name == name || r.name == "refs/heads/" + std::string(name) ||
        r.name == "refs/tags/" + std::string(name)) {
      return r.peeled ? *r.peeled : r.sha;
    }
  }
  return std::nullopt;
}

} // namespace

AckMode ack_mode_for(bool multi_ack, bool multi_ack_detailed) {
  if (multi_ack_detailed)
    return AckMode::MultiDetailed;
  if (multi_ack)
    return AckMode::Multi;
  return AckMode::Single;
}

Status process_wants(NegotiationSession &session, const std::vector<std::string> &wants,
                     const ObjectSource &src) {
  if (session.state != NegotiationState::AwaitingWants) {
    return fail(session, Status::error(ErrorKind::NegotiationError, "wants already received"));
  }
  if (wants.empty()) {
    return fail(session, Status::error(ErrorKind::NegotiationError, "no wants"));
  }
  for (const auto &w : wants) {
    if (!looks_hex40(w)) {
      return fail(session,
                  Status::error(ErrorKind::NegotiationError, "invalid want id '" + w + "'"));
    }
    auto sha = lower_hex(w);
    if (!src.has_object(sha)) {
      return fail(session, Status::error(ErrorKind::NegotiationError, "not our ref " + sha));
    }
    if (std::ranges::find(session.wants, sha) == session.wants.end())
      session.wants.push_back(std::move(sha));
  }
  session.state = NegotiationState::AwaitingHaves;
  return Status::ok();
}

bool ok_to_give_up(NegotiationSession &session, const ObjectSource &src) {
  if (session.common_set.empty())
    return false;
  for (const auto &w : session.wants) {
    if (session.covered_wants.contains(w))
      continue;
    const auto c = commit_of(src, w);
    if (!c) {
      session.covered_wants.insert(w); // blob/tree wants have no history
      continue;
    }
    std::vector<std::string> stack{*c};
    std::unordered_set<std::string> seen;
    bool covered = false;
    while (!stack.empty() && !covered) {
      auto cur = std::move(stack.back());
      stack.pop_back();
      if (!seen.insert(cur).second)
        continue;
      if (session.common_closure.contains(cur)) {
        covered = true;
        break;
      }
      for (auto &p : src.get_commit_parents(cur))
        stack.push_back(std::move(p));
    }
    if (!covered)
      return false;
    session.covered_wants.insert(w);
  }
  return true;
}

Result<HavesResult> process_haves(NegotiationSession &session,
                                  const std::vector<std::string> &haves, const ObjectSource &src,
                                  bool client_done) {
  switch (session.state) {
  case NegotiationState::AwaitingWants:
    return fail(session, Status::error(ErrorKind::NegotiationError, "have before want"));
  case NegotiationState::Ready:
  case NegotiationState::Failed:
    return Status::error(ErrorKind::NegotiationError, "negotiation already finished");
  default:
    break;
  }
  session.state = NegotiationState::Negotiating;

  HavesResult res;
  try {
    if (auto st = build_want_ancestry(session, src); !st)
      return fail(session, st);

    for (const auto &h : haves) {
      if (session.stop.stop_requested())
        return fail(session, cancelled());
      if (!looks_hex40(h)) {
        return fail(session,
                    Status::error(ErrorKind::NegotiationError, "invalid have id '" + h + "'"));
      }
      auto sha = lower_hex(h);
      session.haves.insert(sha);
      if (session.common_set.contains(sha) || !src.has_object(sha))
        continue;

      const auto commit = commit_of(src, sha);
      if (!commit)
        continue;
      if (!session.want_ancestry.contains(*commit)) {
        auto reaches = reaches_want_ancestry(session, src, *commit);
        if (!reaches)
          return fail(session, reaches.status());
        if (!reaches.value())
          continue;
      }

      session.common_set.insert(sha);
      session.common_ancestors.push_back(sha);
      if (auto st = mark_ancestry(src, *commit, session.common_closure, session.stop); !st)
        return fail(session, st);

      if (session.ack_mode == AckMode::Multi)
        res.acks.push_back(Ack{sha, AckStatus::Continue});
      else if (session.ack_mode == AckMode::MultiDetailed)
        res.acks.push_back(Ack{sha, AckStatus::Common});
    }

    bool finish = client_done;
    if (!client_done) {
      const bool give_up = session.ack_mode == AckMode::MultiDetailed &&
                           ok_to_give_up(session, src);
      if (give_up)
        res.acks.push_back(Ack{session.common_ancestors.back(), AckStatus::Ready});
      res.nak = session.ack_mode != AckMode::Single || session.common_ancestors.empty();
      if (give_up && session.no_done) {
        res.final_ack = Ack{session.common_ancestors.back(), AckStatus::None};
        finish = true;
      }
    } else if (session.common_ancestors.empty()) {
      res.nak = true;
    } else {
      res.final_ack = Ack{session.common_ancestors.back(), AckStatus::None};
    }

    if (finish) {
      auto have_boundary = session.shallow_commits;
      have_boundary.insert(session.client_shallow.begin(), session.client_shallow.end());
      auto objects = calculate_missing_objects(src, session.wants, session.common_ancestors,
                                               session.shallow_commits, have_boundary,
                                               session.stop);
      if (!objects)
        return fail(session, objects.status());
      res.objects_to_send = std::move(objects).value();
      res.ready = true;
      session.negotiation_complete = true;
      session.state = NegotiationState::Ready;
    }
  } catch (const Error &e) {
    return fail(session, Status::error(e.kind(), e.what()));
  }
  return res;
}

Result<std::vector<std::string>>
calculate_missing_objects(const ObjectSource &src, const std::vector<std::string> &wants,
                          const std::vector<std::string> &haves,
                          const std::set<std::string> &shallow_boundary, std::stop_token stop) {
  return calculate_missing_objects(src, wants, haves, shallow_boundary, shallow_boundary,
                                   std::move(stop));
}

Result<std::vector<std::string>>
calculate_missing_objects(const ObjectSource &src, const std::vector<std::string> &wants,
                          const std::vector<std::string> &haves,
                          const std::set<std::string> &shallow_boundary,
                          const std::set<std::string> &have_boundary, std::stop_token stop) {
  std::unordered_set<std::string> excluded;
  std::vector<std::string> have_roots;
  have_roots.reserve(haves.size());
  for (const auto &h : haves)
    have_roots.push_back(lower_hex(h));
  if (auto st = walk_objects(src, have_roots, excluded, nullptr, have_boundary, stop, nullptr);
      !st) {
    return st;
  }

  std::vector<std::string> want_roots;
  want_roots.reserve(wants.size());
  for (const auto &w : wants)
    want_roots.push_back(lower_hex(w));

  // The client holds these commits without their parents; the deeper history
  // is sent as if wanted.
  for (const auto &c : have_boundary) {
    if (shallow_boundary.contains(c) || !excluded.contains(c))
      continue;
    for (auto &p : src.get_commit_parents(c))
      want_roots.push_back(lower_hex(p));
  }

  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  if (auto st = walk_objects(src, want_roots, seen, &excluded, shallow_boundary, stop, &out); !st)
    return st;
  return out;
}

Result<ShallowResult> process_shallow(NegotiationSession &session, const ObjectSource &src,
                                      std::optional<std::uint32_t> depth,
                                      std::optional<std::int64_t> deepen_since,
                                      const std::vector<std::string> &deepen_not) {
  session.depth = depth;
  session.deepen_since = deepen_since;
  session.deepen_not = deepen_not;

  ShallowResult out;
  if (!depth && !deepen_since && deepen_not.empty()) {
    session.shallow_commits = session.client_shallow;
    return out;
  }

  try {
    std::unordered_set<std::string> excluded;
    if (!deepen_not.empty()) {
      const auto refs = src.get_refs();
      for (const auto &name : deepen_not) {
        const auto target = resolve_ref(refs, name);
        const auto commit = target ? commit_of(src, *target) : std::nullopt;
        if (!commit) {
          return fail(session, Status::error(ErrorKind::NegotiationError,
                                             "deepen-not is not a known ref: '" + name + "'"));
        }
        if (auto st = mark_ancestry(src, *commit, excluded, session.stop); !st)
          return fail(session, st);
      }
    }

    std::set<std::string> boundary;
    std::vector<std::string> boundary_order;
    std::unordered_set<std::string> visited;
    std::deque<std::pair<std::string, std::uint32_t>> queue;
    for (const auto &w : session.wants) {
      if (auto c = commit_of(src, w))
        queue.emplace_back(std::move(*c), 1);
    }

    while (!queue.empty()) {
      if (session.stop.stop_requested())
        return fail(session, cancelled());
      auto [cur, gen] = std::move(queue.front());
      queue.pop_front();
      if (!visited.insert(cur).second)
        continue;

      const auto parents = src.get_commit_parents(cur);
      bool cut = depth && gen >= *depth;
      if (!cut) {
        cut = std::ranges::any_of(parents, [&](const std::string &p) {
          return excluded.contains(p) || (deepen_since && commit_time(src, p) < *deepen_since);
        });
      }
      if (cut) {
        if (!parents.empty() && boundary.insert(cur).second)
          boundary_order.push_back(cur);
        continue;
      }
      for (const auto &p : parents)
        queue.emplace_back(p, gen + 1);
    }

    for (const auto &c : boundary_order) {
      if (!session.client_shallow.contains(c))
        out.new_shallow.push_back(c);
    }
    for (const auto &c : session.client_shallow) {
      if (visited.contains(c) && !boundary.contains(c))
        out.unshallow.push_back(c);
    }

    session.shallow_commits = boundary;
    for (const auto &c : session.client_shallow) {
      if (std::ranges::find(out.unshallow, c) == out.unshallow.end())
        session.shallow_commits.insert(c);
    }
  } catch (const Error &e) {
    return fail(session, Status::error(e.kind(), e.what()));
  }
  return out;
}

bool is_ancestor(const ObjectSource &src, std::string_view ancestor, std::string_view descendant) {
  if (ancestor == descendant)
    return true;
  std::vector<std::string> stack{std::string(descendant)};
  std::unordered_set<std::string> seen;
  while (!stack.empty()) {
    const auto cur = stack.back();
    stack.pop_back();
    if (!seen.insert(cur).second)
      continue;
    for (auto &p : src.get_commit_parents(cur)) {
      if (p == ancestor)
        return true;
      stack.push_back(std::move(p));
    }
  }
  return false;
}

std::string format_ack(const Ack &ack) {
  std::string s(consts::kTokAck);
  s += ack.sha;
  if (ack.status != AckStatus::None) {
    s += consts::kSpace;
    s += status_word(ack.status);
  }
  s += consts::kLF;
  return s;
}

std::string format_nak() { return std::string(consts::kTokNak) + consts::kLF; }

std::string format_shallow(std::string_view sha) {
  return std::string(consts::kTokShallow) + std::string(sha) + consts::kLF;
}

std::string format_unshallow(std::string_view sha) {
  return std::string(consts::kTokUnshallow) + std::string(sha) + consts::kLF;
}

Result<std::optional<Ack>> parse_ack(std::string_view line) {
  line = strutil::chomp(line);
  if (line == consts::kTokNak)
    return std::optional<Ack>{};
  if (!line.starts_with(consts::kTokAck)) {
    return Status::error(ErrorKind::NegotiationError, "expected ACK or NAK: '" +
                                                          std::string(line) + "'");
  }
  const auto fields = strutil::split_ws(line.substr(consts::kTokAck.size()));
  if (fields.empty() || fields.size() > 2 || !is_sha1_hex(fields[0])) {
    return Status::error(ErrorKind::NegotiationError, "malformed ACK: '" + std::string(line) + "'");
  }
  Ack ack{std::string(fields[0]), AckStatus::None};
  if (fields.size() == 2) {
    if (fields[1] == "continue")
      ack.status = AckStatus::Continue;
    else if (fields[1] == "common")
      ack.status = AckStatus::Common;
    else if (fields[1] == "ready")
      ack.status = AckStatus::Ready;
    else
      return Status::error(ErrorKind::NegotiationError,
                           "invalid ACK status '" + std::string(fields[1]) + "'");
  }
  return std::optional<Ack>{std::move(ack)};
}

} // namespace gitwire::negotiation
