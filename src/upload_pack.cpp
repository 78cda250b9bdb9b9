#include "gitwire/upload_pack.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/pkt_line.hpp"
#include "gitwire/ref_advertiser.hpp"
#include "gitwire/util.hpp"

#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace gitwire {

namespace {

// Thin-pack base search: commits looked at, objects walked.
constexpr std::size_t kThinBaseCommits = 16;
constexpr std::size_t kThinBaseWalk = 10000;
constexpr std::string_view kTagsPrefix = "refs/tags/";

void write_pkt(Connection &conn, std::string_view line) { conn.write_all(pktline::encode(line)); }

// "ERR <msg>" is understood by clients until the pack starts.
auto reject(Connection &conn, Status st) -> Status {
  write_pkt(conn, "ERR " + st.message + "\n");
  return st;
}

auto is_done(const pktline::Packet &pkt) -> bool {
  return pkt.is_data() && strutil::chomp(pkt.text()) == consts::kTokDone;
}

struct Round {
  std::vector<std::string> haves;
  bool done = false;
  bool eof = false;
};

// Haves of one stateful round, up to a flush or "done".
auto read_round(PacketReader &reader) -> Result<Round> {
  Round r;
  while (true) {
    auto pkt = reader.next();
    if (!pkt)
      return pkt.status();
    if (!pkt.value()) {
      r.eof = true;
      return r;
    }
    const auto &p = *pkt.value();
    if (p.type == pktline::PacketType::Flush)
      return r;
    if (!p.is_data()) {
      return Status::error(ErrorKind::ProtocolFraming, "unexpected marker packet among haves");
    }
    if (is_done(p)) {
      r.done = true;
      return r;
    }
    auto have = request::parse_have(p.text());
    if (!have)
      return have.status();
    r.haves.push_back(std::move(have).value());
  }
}

void write_acks(Connection &conn, const HavesResult &res) {
  std::vector<std::uint8_t> out;
  for (const auto &ack : res.acks)
    pktline::append_data(out, negotiation::format_ack(ack));
  if (res.nak)
    pktline::append_data(out, negotiation::format_nak());
  if (res.final_ack)
    pktline::append_data(out, negotiation::format_ack(*res.final_ack));
  if (!out.empty())
    conn.write_all(out);
}

void append_shallow_info(std::vector<std::uint8_t> &out, const ShallowResult &sh) {
  for (const auto &c : sh.new_shallow)
    pktline::append_data(out, negotiation::format_shallow(c));
  for (const auto &c : sh.unshallow)
    pktline::append_data(out, negotiation::format_unshallow(c));
}

// Annotated tags whose target is in the pack (include-tag).
void add_included_tags(const ObjectSource &src, const NegotiationSession &session,
                       std::vector<std::string> &objects) {
  std::unordered_set<std::string> sending(objects.begin(), objects.end());
  for (const auto &ref : src.get_refs()) {
    if (!ref.peeled || !ref.name.starts_with(kTagsPrefix) || !sending.contains(*ref.peeled))
      continue;
    std::string cur = ref.sha;
    for (int hop = 0; hop < 64 && !sending.contains(cur) && !session.haves.contains(cur); ++hop) {
      const auto obj = src.get_object(cur);
      if (!obj || obj->type != ObjectType::Tag)
        break;
      sending.insert(cur);
      objects.push_back(cur);
      cur = lower_hex(parse_tag(obj->data).object_hex);
    }
  }
}

// Load every object, remembering the tree path each blob/tree was reached by.
auto collect_objects(const ObjectSource &src, const std::vector<std::string> &ids,
                     const std::stop_token &stop) -> Result<std::vector<pack::PackableObject>> {
  std::vector<pack::PackableObject> out;
  out.reserve(ids.size());
  std::unordered_map<std::string, std::string> path_of;

  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i % 256 == 0 && stop.stop_requested())
      return Status::error(ErrorKind::Cancelled, "object collection cancelled");
    auto obj = src.get_object(ids[i]);
    if (!obj)
      return Status::error(ErrorKind::ObjectNotFound, "missing object " + ids[i]);

    pack::PackableObject po{ids[i], obj->type, std::move(obj->data), std::nullopt, std::nullopt};
    if (const auto p = path_of.find(po.sha); p != path_of.end())
      po.path = p->second;

    if (po.type == ObjectType::Commit) {
      const auto info = parse_commit(po.data);
      po.timestamp = info.committer_time;
      path_of.try_emplace(lower_hex(info.tree_hex), "");
    } else if (po.type == ObjectType::Tree) {
      const std::string base = po.path.value_or("");
      for (const auto &e : parse_tree(po.data)) {
        if (e.mode == consts::kModeGitlink)
          continue;
        path_of.try_emplace(to_hex(e.id), base.empty() ? e.name : base + "/" + e.name);
      }
    }
    out.push_back(std::move(po));
  }
  return out;
}

auto fatal(sideband::Mux &mux, Status st) -> Status {
  mux.error("upload-pack: " + st.message + "\n");
  return st;
}

} // namespace

UploadPack::UploadPack(const ObjectSource &src, UploadPackOptions opts)
    : src_(src), opts_(std::move(opts)) {}

CapabilitySet UploadPack::v1_capabilities() const {
  const auto &cfg = opts_.config;
  CapabilitySet caps;
  caps.set(Capability::MultiAck);
  caps.set(Capability::MultiAckDetailed);
  if (cfg.no_done)
    caps.set(Capability::NoDone);
  if (cfg.thin_pack)
    caps.set(Capability::ThinPack);
  caps.set(Capability::SideBand);
  if (cfg.side_band_64k)
    caps.set(Capability::SideBand64k);
  if (cfg.ofs_delta)
    caps.set(Capability::OfsDelta);
  if (cfg.shallow) {
    caps.set(Capability::Shallow);
    caps.set(Capability::DeepenSince);
    caps.set(Capability::DeepenNot);
  }
  caps.set(Capability::NoProgress);
  if (cfg.include_tag)
    caps.set(Capability::IncludeTag);
  if (const auto head = src_.head_symref())
    caps.set(Capability::Symref, "HEAD:" + *head);
  caps.set(Capability::ObjectFormat, "sha1");
  caps.set(Capability::Agent, cfg.agent);
  return caps;
}

CapabilitySet UploadPack::v2_capabilities() const {
  CapabilitySet caps;
  caps.set(Capability::Agent, opts_.config.agent);
  caps.set(Capability::LsRefs, "unborn");
  caps.set(Capability::Fetch, opts_.config.shallow ? "shallow wait-for-done" : "wait-for-done");
  caps.set(Capability::ServerOption);
  caps.set(Capability::ObjectFormat, "sha1");
  return caps;
}

std::vector<std::uint8_t> UploadPack::advertisement() const {
  std::vector<std::uint8_t> out;
  if (opts_.http_preamble)
    out = refadv::service_header(consts::kServiceUpload);

  if (opts_.version == ProtocolVersion::V2 && opts_.config.protocol_v2) {
    append(out, refadv::advertise_v2(v2_capabilities()));
    return out;
  }
  if (opts_.version == ProtocolVersion::V1)
    pktline::append_data(out, "version 1\n");
  append(out, refadv::advertise(src_.get_refs(), v1_capabilities()));
  return out;
}

Status UploadPack::serve(Connection &conn) {
  try {
    if (!opts_.stateless_rpc || opts_.advertise_refs)
      conn.write_all(advertisement());
    if (opts_.advertise_refs)
      return Status::ok();

    PacketReader reader(conn);
    if (opts_.version == ProtocolVersion::V2 && opts_.config.protocol_v2)
      return serve_v2(conn, reader);
    return serve_v1(conn, reader);
  } catch (const std::system_error &e) {
    return Status::error(ErrorKind::Io, e.what());
  } catch (const Error &e) {
    return Status::error(e.kind(), e.what());
  } catch (const std::runtime_error &e) {
    // unreadable repository data
    return Status::error(ErrorKind::ObjectNotFound, e.what());
  }
}

Result<std::vector<std::uint8_t>> UploadPack::handle_request(std::span<const std::uint8_t> body) {
  MemoryConnection conn({body.begin(), body.end()});
  if (auto st = serve(conn); !st)
    return st;
  return conn.output();
}

bool UploadPack::deepening(const FetchRequest &req) const {
  return req.depth || req.deepen_since || !req.deepen_not.empty();
}

Status UploadPack::start_session(NegotiationSession &session, const FetchRequest &req) {
  if (req.filter) {
    return Status::error(ErrorKind::CapabilityError, "filter is not supported");
  }
  if (deepening(req) && !opts_.config.shallow) {
    return Status::error(ErrorKind::CapabilityError, "shallow fetches are disabled");
  }
  session.stop = opts_.stop;
  return negotiation::process_wants(session, req.wants, src_);
}

Result<ShallowResult> UploadPack::apply_shallow(NegotiationSession &session,
                                                const FetchRequest &req) {
  session.client_shallow.insert(req.shallow.begin(), req.shallow.end());
  return negotiation::process_shallow(session, src_, req.depth, req.deepen_since,
                                      req.deepen_not);
}

Status UploadPack::serve_v1(Connection &conn, PacketReader &reader) {
  auto head = reader.until_flush();
  if (!head)
    return reject(conn, head.status());
  auto packets = std::move(head).value();
  if (packets.size() <= 1)
    return Status::ok(); // no wants: the client only listed refs

  if (opts_.stateless_rpc) {
    // the same body carries the haves
    while (true) {
      auto pkt = reader.next();
      if (!pkt)
        return reject(conn, pkt.status());
      if (!pkt.value())
        break;
      const bool done = is_done(*pkt.value());
      packets.push_back(std::move(*pkt.value()));
      if (done)
        break;
    }
  }

  auto parsed = request::parse_v1(packets);
  if (!parsed)
    return reject(conn, parsed.status());
  const auto &req = parsed.value();
  const auto caps = v1_capabilities();
  const auto negotiated = [&](Capability c) { return caps.has(c) && req.wants_capability(c); };

  NegotiationSession session;
  if (auto st = start_session(session, req); !st)
    return reject(conn, st);
  session.ack_mode = negotiation::ack_mode_for(negotiated(Capability::MultiAck),
                                               negotiated(Capability::MultiAckDetailed));
  session.no_done = session.ack_mode == AckMode::MultiDetailed && negotiated(Capability::NoDone);

  auto shallow = apply_shallow(session, req);
  if (!shallow)
    return reject(conn, shallow.status());
  if (deepening(req)) {
    std::vector<std::uint8_t> out;
    append_shallow_info(out, shallow.value());
    pktline::append_flush(out);
    conn.write_all(out);
  }

  PackRequest how;
  if (negotiated(Capability::SideBand64k))
    how.mode = sideband::Mode::SideBand64k;
  else if (negotiated(Capability::SideBand))
    how.mode = sideband::Mode::SideBand;
  how.progress = !negotiated(Capability::NoProgress);
  how.ofs_delta = negotiated(Capability::OfsDelta);
  how.thin_pack = negotiated(Capability::ThinPack);
  how.include_tag = negotiated(Capability::IncludeTag);

  if (opts_.stateless_rpc) {
    auto res = negotiation::process_haves(session, req.haves, src_, req.done);
    if (!res)
      return reject(conn, res.status());
    write_acks(conn, res.value());
    if (!res.value().ready)
      return Status::ok(); // the client comes back with more haves
    return send_pack(conn, session, std::move(res.value().objects_to_send), how);
  }

  while (true) {
    auto round = read_round(reader);
    if (!round)
      return reject(conn, round.status());
    if (round.value().eof)
      return Status::error(ErrorKind::Io, "client hung up during negotiation");
    auto res = negotiation::process_haves(session, round.value().haves, src_, round.value().done);
    if (!res)
      return reject(conn, res.status());
    write_acks(conn, res.value());
    if (res.value().ready)
      return send_pack(conn, session, std::move(res.value().objects_to_send), how);
  }
}

Status UploadPack::serve_v2(Connection &conn, PacketReader &reader) {
  while (true) {
    auto packets = reader.until_flush();
    if (!packets)
      return reject(conn, packets.status());
    if (packets.value().size() <= 1)
      return Status::ok(); // end of stream or a bare flush

    auto cmd = request::parse_command(packets.value());
    if (!cmd)
      return reject(conn, cmd.status());

    Status st;
    if (cmd.value().command == "ls-refs") {
      st = ls_refs_v2(conn, cmd.value().args);
    } else if (cmd.value().command == "fetch") {
      st = fetch_v2(conn, cmd.value().args);
    } else {
      st = reject(conn, Status::error(ErrorKind::CapabilityError,
                                      "unknown command '" + cmd.value().command + "'"));
    }
    if (!st || opts_.stateless_rpc)
      return st;
  }
}

Status UploadPack::ls_refs_v2(Connection &conn, const std::vector<std::string> &args) {
  refadv::LsRefsOptions o;
  constexpr std::string_view kRefPrefixArg = "ref-prefix ";
  for (const auto &arg : args) {
    if (arg == "peel")
      o.peel = true;
    else if (arg == "symrefs")
      o.symrefs = true;
    else if (arg == "unborn")
      o.unborn = true;
    else if (arg.starts_with(kRefPrefixArg))
      o.ref_prefixes.push_back(arg.substr(kRefPrefixArg.size()));
    else
      return reject(conn, Status::error(ErrorKind::NegotiationError,
                                        "unexpected ls-refs argument '" + arg + "'"));
  }
  conn.write_all(refadv::ls_refs(src_.get_refs(), src_.head_symref(), o));
  return Status::ok();
}

Status UploadPack::fetch_v2(Connection &conn, const std::vector<std::string> &args) {
  auto parsed = request::parse_v2_fetch(args);
  if (!parsed)
    return reject(conn, parsed.status());
  const auto &req = parsed.value();
  const auto &cfg = opts_.config;

  NegotiationSession session;
  if (auto st = start_session(session, req); !st)
    return reject(conn, st);
  session.ack_mode = AckMode::MultiDetailed;
  session.no_done = !req.wait_for_done;

  auto shallow = apply_shallow(session, req);
  if (!shallow)
    return reject(conn, shallow.status());
  auto res = negotiation::process_haves(session, req.haves, src_, req.done);
  if (!res)
    return reject(conn, res.status());

  std::vector<std::uint8_t> out;
  if (!req.done) {
    pktline::append_data(out, "acknowledgments\n");
    bool acked = false;
    for (const auto &ack : res.value().acks) {
      if (ack.status != AckStatus::Common)
        continue;
      pktline::append_data(out, negotiation::format_ack(Ack{ack.sha, AckStatus::None}));
      acked = true;
    }
    if (!acked)
      pktline::append_data(out, negotiation::format_nak());
    if (!res.value().ready) {
      pktline::append_flush(out);
      conn.write_all(out);
      return Status::ok();
    }
    pktline::append_data(out, "ready\n");
    pktline::append_delimiter(out);
  }
  if (deepening(req)) {
    pktline::append_data(out, "shallow-info\n");
    append_shallow_info(out, shallow.value());
    pktline::append_delimiter(out);
  }
  pktline::append_data(out, "packfile\n");
  conn.write_all(out);

  PackRequest how;
  how.mode = sideband::Mode::SideBand64k;
  how.progress = !req.no_progress;
  how.ofs_delta = cfg.ofs_delta && req.ofs_delta;
  how.thin_pack = cfg.thin_pack && req.thin_pack;
  how.include_tag = cfg.include_tag && req.include_tag;
  return send_pack(conn, session, std::move(res.value().objects_to_send), how);
}

Status UploadPack::send_pack(Connection &conn, const NegotiationSession &session,
                             std::vector<std::string> objects, const PackRequest &how) {
  sideband::Mux mux(how.mode, [&conn](std::span<const std::uint8_t> b) { conn.write_all(b); });
  const ProgressSink progress = [&](std::string_view msg) {
    if (how.progress)
      mux.progress(msg);
  };

  try {
    if (how.include_tag)
      add_included_tags(src_, session, objects);
    const auto n = std::to_string(objects.size());
    progress("Enumerating objects: " + n + ", done.\n");

    auto packable = collect_objects(src_, objects, opts_.stop);
    if (!packable)
      return fatal(mux, packable.status());
    progress("Counting objects: 100% (" + n + "/" + n + "), done.\n");

    auto po = opts_.config.pack_options();
    po.ofs_delta = how.ofs_delta;
    po.stop = opts_.stop;
    po.progress = progress;
    if (how.thin_pack)
      po.client_bases = client_bases(session, packable.value());

    auto pack = pack::generate(std::move(packable).value(), po);
    if (!pack)
      return fatal(mux, pack.status());
    last_pack_ = pack.value().stats;
    mux.pack_data(pack.value().bytes);
    mux.flush();
    return Status::ok();
  } catch (const std::system_error &) {
    throw; // the connection is gone; nothing more can be sent
  } catch (const Error &e) {
    return fatal(mux, Status::error(e.kind(), e.what()));
  } catch (const std::runtime_error &e) {
    return fatal(mux, Status::error(ErrorKind::ObjectNotFound, e.what()));
  }
}

std::vector<pack::PackableObject>
UploadPack::client_bases(const NegotiationSession &session,
                         const std::vector<pack::PackableObject> &objects) const {
  std::vector<pack::PackableObject> out;
  std::unordered_set<std::string> paths;
  std::unordered_set<std::string> in_pack;
  for (const auto &o : objects) {
    in_pack.insert(o.sha);
    if (o.path && !o.path->empty())
      paths.insert(*o.path);
  }
  if (paths.empty())
    return out;

  std::unordered_set<std::string> seen;
  std::size_t walked = 0;
  std::size_t commits = 0;
  for (const auto &common : session.common_ancestors) {
    if (commits == kThinBaseCommits || walked >= kThinBaseWalk)
      break;
    std::string sha = common;
    if (auto peeled = peel_tag(src_, sha))
      sha = std::move(*peeled);
    const auto commit = src_.get_object(sha);
    if (!commit || commit->type != ObjectType::Commit)
      continue;
    ++commits;

    // (id, path) pairs still to visit
    std::vector<std::pair<std::string, std::string>> stack{
        {lower_hex(parse_commit(commit->data).tree_hex), ""}};
    while (!stack.empty() && walked < kThinBaseWalk) {
      auto [id, path] = std::move(stack.back());
      stack.pop_back();
      if (!seen.insert(id).second)
        continue;
      ++walked;
      auto obj = src_.get_object(id);
      if (!obj)
        continue;
      if (obj->type == ObjectType::Tree) {
        for (const auto &e : parse_tree(obj->data)) {
          if (e.mode == consts::kModeGitlink)
            continue;
          stack.emplace_back(to_hex(e.id), path.empty() ? e.name : path + "/" + e.name);
        }
      }
      if (path.empty() || !paths.contains(path) || in_pack.contains(id))
        continue;
      out.push_back(pack::PackableObject{id, obj->type, std::move(obj->data), path, std::nullopt});
    }
  }
  return out;
}

} // namespace gitwire
