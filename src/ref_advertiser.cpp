#include "gitwire/ref_advertiser.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/pkt_line.hpp"
#include "gitwire/util.hpp"

#include <algorithm>

namespace gitwire::refadv {

namespace {

auto matches_prefix(std::string_view name, const std::vector<std::string> &prefixes) -> bool {
  if (prefixes.empty())
    return true;
  return std::ranges::any_of(prefixes,
                             [&](const std::string &p) { return name.starts_with(p); });
}

} // namespace

std::vector<std::uint8_t> advertise(const std::vector<RefLine> &refs, const CapabilitySet &caps) {
  std::vector<std::uint8_t> out;
  const std::string cap_str = caps.to_string();

  if (refs.empty()) {
    std::string line(consts::kZeroOid);
    line += consts::kSpace;
    line += consts::kCapsPseudoRef;
    line += consts::kNul;
    line += cap_str;
    line += consts::kLF;
    pktline::append_data(out, line);
    pktline::append_flush(out);
    return out;
  }

  bool first = true;
  for (const auto &ref : refs) {
    std::string line = ref.sha + consts::kSpace + ref.name;
    if (first) {
      line += consts::kNul;
      line += cap_str;
      first = false;
    }
    line += consts::kLF;
    pktline::append_data(out, line);

    if (ref.peeled) {
      pktline::append_data(out, *ref.peeled + consts::kSpace + ref.name +
                                    std::string(consts::kPeelSuffix) + consts::kLF);
    }
  }
  pktline::append_flush(out);
  return out;
}

std::vector<std::uint8_t> service_header(std::string_view service) {
  std::vector<std::uint8_t> out;
  pktline::append_data(out, "# service=" + std::string(service) + "\n");
  pktline::append_flush(out);
  return out;
}

std::vector<std::uint8_t> advertise_v2(const CapabilitySet &caps) {
  std::vector<std::uint8_t> out;
  for (const auto &line : capabilities::build_v2_lines(caps)) {
    pktline::append_data(out, line + consts::kLF);
  }
  pktline::append_flush(out);
  return out;
}

std::vector<std::uint8_t> ls_refs(const std::vector<RefLine> &refs,
                                  const std::optional<std::string> &head_target,
                                  const LsRefsOptions &opts) {
  std::vector<std::uint8_t> out;
  bool head_seen = false;
  for (const auto &ref : refs) {
    if (!matches_prefix(ref.name, opts.ref_prefixes))
      continue;
    std::string line = ref.sha + consts::kSpace + ref.name;
    if (ref.name == consts::kHeadFile) {
      head_seen = true;
      if (opts.symrefs && head_target)
        line += " symref-target:" + *head_target;
    }
    if (opts.peel && ref.peeled)
      line += " peeled:" + *ref.peeled;
    line += consts::kLF;
    pktline::append_data(out, line);
  }
  // HEAD pointing at a branch that does not exist yet
  if (opts.unborn && !head_seen && head_target &&
      matches_prefix(consts::kHeadFile, opts.ref_prefixes)) {
    std::string line = "unborn HEAD";
    if (opts.symrefs)
      line += " symref-target:" + *head_target;
    line += consts::kLF;
    pktline::append_data(out, line);
  }
  pktline::append_flush(out);
  return out;
}

Result<Advertisement> parse_advertisement(std::span<const std::uint8_t> bytes) {
  Advertisement adv;
  std::size_t pos = 0;
  bool first = true;
  while (true) {
    auto dec = pktline::decode(bytes.subspan(pos));
    if (!dec)
      return dec.status();
    if (dec.value().incomplete()) {
      return Status::error(ErrorKind::ProtocolFraming, "ref advertisement is truncated");
    }
    pos += dec.value().consumed;
    const auto &pkt = *dec.value().packet;
    if (pkt.type == pktline::PacketType::Flush)
      break;
    if (!pkt.is_data()) {
      return Status::error(ErrorKind::ProtocolFraming,
                           "unexpected marker packet in ref advertisement");
    }

    auto parsed = capabilities::parse_from_ref_line(pkt.text(), first);
    if (!parsed)
      return parsed.status();
    auto &line = parsed.value();
    if (first) {
      adv.capabilities = line.capabilities.value_or(CapabilitySet{});
      first = false;
      if (line.name == consts::kCapsPseudoRef)
        continue;
    }

    if (line.name.ends_with(consts::kPeelSuffix)) {
      const auto base = line.name.substr(0, line.name.size() - consts::kPeelSuffix.size());
      if (adv.refs.empty() || adv.refs.back().name != base) {
        return Status::error(ErrorKind::NegotiationError,
                             "peeled line without its tag: '" + line.name + "'");
      }
      adv.refs.back().peeled = line.sha;
      continue;
    }
    adv.refs.push_back(RefLine{std::move(line.sha), std::move(line.name), std::nullopt});
  }
  return adv;
}

} // namespace gitwire::refadv
