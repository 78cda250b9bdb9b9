#include "gitwire/request.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/util.hpp"

#include <algorithm>

namespace gitwire {

namespace {

auto bad_line(std::string_view what, std::string_view line) -> Status {
  return Status::error(ErrorKind::NegotiationError,
                       std::string(what) + ": '" + std::string(line) + "'");
}

// "<token><sha>" with nothing after the id
auto parse_sha_line(std::string_view line, std::string_view token) -> Result<std::string> {
  line = strutil::chomp(line);
  if (!line.starts_with(token)) {
    return bad_line("expected " + std::string(strutil::trim(token)), line);
  }
  const auto rest = strutil::trim(line.substr(token.size()));
  if (!looks_hex40(rest)) {
    return bad_line("invalid object id", line);
  }
  return lower_hex(rest);
}

auto v2_flag(FetchRequest &req, std::string_view line) -> bool {
  if (line == "thin-pack")
    req.thin_pack = true;
  else if (line == "no-progress")
    req.no_progress = true;
  else if (line == "include-tag")
    req.include_tag = true;
  else if (line == "ofs-delta")
    req.ofs_delta = true;
  else if (line == "wait-for-done")
    req.wait_for_done = true;
  else
    return false;
  return true;
}

} // namespace

bool FetchRequest::wants_capability(Capability cap) const {
  switch (cap) {
  case Capability::ThinPack:
    if (thin_pack)
      return true;
    break;
  case Capability::NoProgress:
    if (no_progress)
      return true;
    break;
  case Capability::IncludeTag:
    if (include_tag)
      return true;
    break;
  case Capability::OfsDelta:
    if (ofs_delta)
      return true;
    break;
  default:
    break;
  }
  const auto name = capability_name(cap);
  return std::ranges::any_of(capabilities,
                             [&](const CapabilityEntry &e) { return e.name == name; });
}

namespace request {

Result<WantLine> parse_want(std::string_view line) {
  line = strutil::chomp(line);
  if (!line.starts_with(consts::kTokWant)) {
    return bad_line("expected want", line);
  }
  const auto rest = line.substr(consts::kTokWant.size());
  const auto sp = rest.find(consts::kSpace);
  const auto sha = rest.substr(0, sp);
  if (!looks_hex40(sha)) {
    return bad_line("invalid object id in want", line);
  }
  WantLine out{lower_hex(sha), {}};
  if (sp != std::string_view::npos) {
    auto caps = capabilities::parse_entries(rest.substr(sp + 1));
    if (!caps)
      return caps.status();
    out.capabilities = std::move(caps).value();
  }
  return out;
}

Result<std::string> parse_have(std::string_view line) { return parse_sha_line(line, consts::kTokHave); }

Result<std::string> parse_shallow(std::string_view line) {
  return parse_sha_line(line, consts::kTokShallow);
}

Status apply_line(FetchRequest &req, std::string_view raw, bool v2) {
  const auto line = strutil::chomp(raw);

  if (line.starts_with(consts::kTokWant)) {
    auto want = parse_want(line);
    if (!want)
      return want.status();
    if (v2 && !want.value().capabilities.empty()) {
      return bad_line("capabilities on a v2 want", line);
    }
    if (req.wants.empty() && !v2)
      req.capabilities = std::move(want.value().capabilities);
    if (std::ranges::find(req.wants, want.value().sha) == req.wants.end())
      req.wants.push_back(std::move(want.value().sha));
    return Status::ok();
  }
  if (line.starts_with(consts::kTokHave)) {
    auto have = parse_have(line);
    if (!have)
      return have.status();
    req.haves.push_back(std::move(have).value());
    return Status::ok();
  }
  if (line.starts_with(consts::kTokShallow)) {
    auto sh = parse_shallow(line);
    if (!sh)
      return sh.status();
    req.shallow.push_back(std::move(sh).value());
    return Status::ok();
  }
  if (line.starts_with(consts::kTokDeepenSince)) {
    const auto v = strutil::parse_u64(line.substr(consts::kTokDeepenSince.size()));
    if (!v)
      return bad_line("invalid deepen-since", line);
    req.deepen_since = static_cast<std::int64_t>(*v);
    return Status::ok();
  }
  if (line.starts_with(consts::kTokDeepenNot)) {
    const auto ref = line.substr(consts::kTokDeepenNot.size());
    if (ref.empty())
      return bad_line("empty deepen-not", line);
    req.deepen_not.emplace_back(ref);
    return Status::ok();
  }
  if (line == "deepen-relative") {
    req.deepen_relative = true;
    return Status::ok();
  }
  if (line.starts_with(consts::kTokDeepen)) {
    const auto v = strutil::parse_u64(line.substr(consts::kTokDeepen.size()));
    if (!v || *v == 0 || *v > UINT32_MAX)
      return bad_line("invalid deepen", line);
    req.depth = static_cast<std::uint32_t>(*v);
    return Status::ok();
  }
  if (line.starts_with(consts::kTokFilter)) {
    req.filter = std::string(line.substr(consts::kTokFilter.size()));
    return Status::ok();
  }
  if (line == consts::kTokDone) {
    req.done = true;
    return Status::ok();
  }
  if (v2 && v2_flag(req, line)) {
    return Status::ok();
  }
  return bad_line("unexpected line in upload request", line);
}

Result<FetchRequest> parse_v1(const std::vector<pktline::Packet> &packets) {
  FetchRequest req;
  bool in_haves = false;
  for (const auto &pkt : packets) {
    if (pkt.type == pktline::PacketType::Flush) {
      in_haves = true;
      continue;
    }
    if (!pkt.is_data()) {
      return Status::error(ErrorKind::ProtocolFraming, "unexpected marker packet in v1 request");
    }
    const auto line = strutil::chomp(pkt.text());
    const bool is_negotiation = line.starts_with(consts::kTokHave) || line == consts::kTokDone;
    if (in_haves != is_negotiation) {
      return bad_line(in_haves ? "expected have or done" : "have before the end of wants", line);
    }
    if (auto st = apply_line(req, line, false); !st)
      return st;
    if (req.done)
      break;
  }
  return req;
}

Result<FetchRequest> parse_v2_fetch(const std::vector<std::string> &args) {
  FetchRequest req;
  for (const auto &arg : args) {
    if (auto st = apply_line(req, arg, true); !st)
      return st;
  }
  return req;
}

Result<CommandRequest> parse_command(const std::vector<pktline::Packet> &packets) {
  CommandRequest out;
  bool in_args = false;
  for (const auto &pkt : packets) {
    if (pkt.type == pktline::PacketType::Flush)
      break;
    if (pkt.type == pktline::PacketType::Delimiter) {
      if (in_args)
        return Status::error(ErrorKind::ProtocolFraming, "second delimiter in v2 command");
      in_args = true;
      continue;
    }
    if (!pkt.is_data()) {
      return Status::error(ErrorKind::ProtocolFraming, "unexpected marker packet in v2 command");
    }
    const auto line = strutil::chomp(pkt.text());
    if (in_args) {
      out.args.emplace_back(line);
    } else if (line.starts_with(consts::kTokCommand)) {
      if (!out.command.empty())
        return Status::error(ErrorKind::CapabilityError, "command given twice");
      out.command = std::string(line.substr(consts::kTokCommand.size()));
    } else {
      auto caps = capabilities::parse_entries(line);
      if (!caps)
        return caps.status();
      for (auto &c : caps.value())
        out.capabilities.push_back(std::move(c));
    }
  }
  if (out.command.empty()) {
    return Status::error(ErrorKind::CapabilityError, "v2 request without command=");
  }
  return out;
}

} // namespace request

} // namespace gitwire
