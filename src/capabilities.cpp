#include "gitwire/capabilities.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/util.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace gitwire {

namespace {

constexpr std::array<std::pair<Capability, std::string_view>, 34> kNames{{
    {Capability::MultiAck, "multi_ack"},
    {Capability::MultiAckDetailed, "multi_ack_detailed"},
    {Capability::NoDone, "no-done"},
    {Capability::ThinPack, "thin-pack"},
    {Capability::SideBand, "side-band"},
    {Capability::SideBand64k, "side-band-64k"},
    {Capability::OfsDelta, "ofs-delta"},
    {Capability::Shallow, "shallow"},
    {Capability::DeepenSince, "deepen-since"},
    {Capability::DeepenNot, "deepen-not"},
    {Capability::DeepenRelative, "deepen-relative"},
    {Capability::NoProgress, "no-progress"},
    {Capability::IncludeTag, "include-tag"},
    {Capability::ReportStatus, "report-status"},
    {Capability::ReportStatusV2, "report-status-v2"},
    {Capability::DeleteRefs, "delete-refs"},
    {Capability::Quiet, "quiet"},
    {Capability::Atomic, "atomic"},
    {Capability::PushOptions, "push-options"},
    {Capability::AllowTipSha1InWant, "allow-tip-sha1-in-want"},
    {Capability::AllowReachableSha1InWant, "allow-reachable-sha1-in-want"},
    {Capability::AllowAnySha1InWant, "allow-any-sha1-in-want"},
    {Capability::PushCert, "push-cert"},
    {Capability::Filter, "filter"},
    {Capability::Agent, "agent"},
    {Capability::Symref, "symref"},
    {Capability::ObjectFormat, "object-format"},
    {Capability::SessionId, "session-id"},
    {Capability::LsRefs, "ls-refs"},
    {Capability::Fetch, "fetch"},
    {Capability::ServerOption, "server-option"},
    {Capability::WaitForDone, "wait-for-done"},
    {Capability::ObjectInfo, "object-info"},
    {Capability::BundleUri, "bundle-uri"},
}};

Result<CapabilityEntry> parse_token(std::string_view token) {
  if (token.find(consts::kNul) != std::string_view::npos) {
    return Status::error(ErrorKind::CapabilityError, "NUL inside capability token");
  }
  const auto eq = token.find('=');
  if (eq == 0) {
    return Status::error(ErrorKind::CapabilityError,
                         "capability without a name: '" + std::string(token) + "'");
  }
  if (eq == std::string_view::npos) {
    return CapabilityEntry{std::string(token), std::nullopt};
  }
  return CapabilityEntry{std::string(token.substr(0, eq)), std::string(token.substr(eq + 1))};
}

} // namespace

std::string_view capability_name(Capability cap) {
  for (const auto &[c, name] : kNames) {
    if (c == cap)
      return name;
  }
  return {};
}

std::optional<Capability> capability_from_name(std::string_view name) {
  for (const auto &[c, n] : kNames) {
    if (n == name)
      return c;
  }
  return std::nullopt;
}

std::string CapabilityEntry::to_string() const {
  return value ? name + "=" + *value : name;
}

void CapabilitySet::set(Capability cap, std::optional<std::string> value) {
  known_[cap] = std::move(value);
}

void CapabilitySet::set(std::string_view name, std::optional<std::string> value) {
  if (auto cap = capability_from_name(name)) {
    set(*cap, std::move(value));
    return;
  }
  extensions_.insert_or_assign(std::string(name), std::move(value));
}

void CapabilitySet::erase(Capability cap) { known_.erase(cap); }

bool CapabilitySet::has(Capability cap) const { return known_.contains(cap); }

bool CapabilitySet::has(std::string_view name) const {
  if (auto cap = capability_from_name(name))
    return has(*cap);
  return extensions_.find(name) != extensions_.end();
}

std::optional<std::string> CapabilitySet::value(Capability cap) const {
  const auto it = known_.find(cap);
  return it == known_.end() ? std::nullopt : it->second;
}

std::optional<std::string> CapabilitySet::value(std::string_view name) const {
  if (auto cap = capability_from_name(name))
    return value(*cap);
  const auto it = extensions_.find(name);
  return it == extensions_.end() ? std::nullopt : it->second;
}

std::vector<CapabilityEntry> CapabilitySet::entries() const {
  std::vector<CapabilityEntry> out;
  out.reserve(size());
  for (const auto &[cap, val] : known_) {
    out.push_back(CapabilityEntry{std::string(capability_name(cap)), val});
  }
  for (const auto &[name, val] : extensions_) {
    out.push_back(CapabilityEntry{name, val});
  }
  return out;
}

std::string CapabilitySet::to_string() const {
  std::string s;
  for (const auto &e : entries()) {
    if (!s.empty())
      s.push_back(consts::kSpace);
    s += e.to_string();
  }
  return s;
}

namespace capabilities {

Result<std::vector<CapabilityEntry>> parse_entries(std::string_view caps) {
  std::vector<CapabilityEntry> out;
  for (const auto token : strutil::split_ws(caps)) {
    auto entry = parse_token(token);
    if (!entry)
      return entry.status();
    out.push_back(std::move(entry).value());
  }
  return out;
}

Result<CapabilitySet> parse(std::string_view caps) {
  auto entries = parse_entries(caps);
  if (!entries)
    return entries.status();
  CapabilitySet set;
  for (auto &e : entries.value()) {
    set.set(e.name, std::move(e.value));
  }
  return set;
}

Result<RefLineCaps> parse_from_ref_line(std::string_view line, bool is_first_ref) {
  line = strutil::chomp(line);

  std::string_view ref_part = line;
  std::optional<CapabilitySet> caps;
  const auto nul = line.find(consts::kNul);
  if (nul != std::string_view::npos) {
    ref_part = line.substr(0, nul);
    auto parsed = parse(line.substr(nul + 1));
    if (!parsed)
      return parsed.status();
    caps = std::move(parsed).value();
  } else if (is_first_ref) {
    return Status::error(ErrorKind::CapabilityError,
                         "first ref advertisement line has no NUL capability separator");
  }

  const auto sp = ref_part.find(consts::kSpace);
  if (sp == std::string_view::npos) {
    return Status::error(ErrorKind::NegotiationError,
                         "ref line missing space between id and name");
  }
  const auto sha = ref_part.substr(0, sp);
  if (!is_sha1_hex(sha)) {
    return Status::error(ErrorKind::NegotiationError,
                         "ref line has invalid object id '" + std::string(sha) + "'");
  }
  return RefLineCaps{std::string(sha), std::string(ref_part.substr(sp + 1)), std::move(caps)};
}

std::vector<CapabilityEntry> select_common(const CapabilitySet &server,
                                           const std::vector<CapabilityEntry> &client_prefs) {
  std::vector<CapabilityEntry> out;
  for (const auto &pref : client_prefs) {
    if (!server.has(pref.name))
      continue;
    const bool dup = std::ranges::any_of(out, [&](const auto &e) { return e.name == pref.name; });
    if (!dup)
      out.push_back(pref);
  }
  return out;
}

std::vector<std::string> validate_required(const CapabilitySet &caps,
                                           const std::vector<std::string> &required) {
  std::vector<std::string> missing;
  for (const auto &name : required) {
    if (!caps.has(name))
      missing.push_back(name);
  }
  return missing;
}

std::vector<std::string> build_v2_lines(const CapabilitySet &caps) {
  // the order git itself advertises in; anything else follows
  static constexpr std::array kLeading{
      Capability::Agent,        Capability::LsRefs,    Capability::Fetch,
      Capability::ServerOption, Capability::ObjectFormat, Capability::SessionId,
      Capability::ObjectInfo,   Capability::BundleUri,
  };
  std::vector<std::string> lines{std::string(consts::kTokVersion2)};
  for (const auto cap : kLeading) {
    if (caps.has(cap))
      lines.push_back(CapabilityEntry{std::string(capability_name(cap)), caps.value(cap)}.to_string());
  }
  for (const auto &e : caps.entries()) {
    const auto known = capability_from_name(e.name);
    if (!known || std::ranges::find(kLeading, *known) == kLeading.end())
      lines.push_back(e.to_string());
  }
  return lines;
}

Result<CapabilitySet> parse_v2_lines(const std::vector<std::string> &lines) {
  if (lines.empty() || strutil::chomp(lines.front()) != consts::kTokVersion2) {
    return Status::error(ErrorKind::CapabilityError,
                         "protocol v2 advertisement must start with 'version 2'");
  }
  CapabilitySet set;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto line = strutil::chomp(lines[i]);
    // v2 values may contain spaces ("fetch=shallow filter"), so no splitting
    auto entry = parse_token(line);
    if (!entry)
      return entry.status();
    if (entry.value().name.find(consts::kSpace) != std::string::npos) {
      return Status::error(ErrorKind::CapabilityError,
                           "whitespace in v2 capability name '" + entry.value().name + "'");
    }
    set.set(entry.value().name, std::move(entry).value().value);
  }
  return set;
}

ProtocolVersion requested_version(std::string_view extra) {
  ProtocolVersion best = ProtocolVersion::V0;
  std::size_t pos = 0;
  while (pos <= extra.size()) {
    auto end = extra.find_first_of(std::string_view(":\0", 2), pos);
    if (end == std::string_view::npos)
      end = extra.size();
    const auto item = extra.substr(pos, end - pos);
    if (item == "version=2")
      best = ProtocolVersion::V2;
    else if (item == "version=1" && best == ProtocolVersion::V0)
      best = ProtocolVersion::V1;
    pos = end + 1;
  }
  return best;
}

} // namespace capabilities

} // namespace gitwire
