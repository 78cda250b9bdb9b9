#pragma once
#include "gitwire/error.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

enum class ProtocolVersion : std::uint8_t { V0 = 0, V1 = 1, V2 = 2 };

// Capabilities this server understands. Anything else lands in the
// extension map of CapabilitySet and still round-trips.
enum class Capability : std::uint8_t {
  MultiAck,
  MultiAckDetailed,
  NoDone,
  ThinPack,
  SideBand,
  SideBand64k,
  OfsDelta,
  Shallow,
  DeepenSince,
  DeepenNot,
  DeepenRelative,
  NoProgress,
  IncludeTag,
  ReportStatus,
  ReportStatusV2,
  DeleteRefs,
  Quiet,
  Atomic,
  PushOptions,
  AllowTipSha1InWant,
  AllowReachableSha1InWant,
  AllowAnySha1InWant,
  PushCert,
  Filter,
  Agent,
  Symref,
  ObjectFormat,
  SessionId,
  // protocol v2 commands / keys
  LsRefs,
  Fetch,
  ServerOption,
  WaitForDone,
  ObjectInfo,
  BundleUri,
};

[[nodiscard]] auto capability_name(Capability cap) -> std::string_view;
[[nodiscard]] auto capability_from_name(std::string_view name) -> std::optional<Capability>;

struct CapabilityEntry {
  std::string name;
  std::optional<std::string> value; // nullopt: bare token

  [[nodiscard]] auto to_string() const -> std::string;
  friend bool operator==(const CapabilityEntry &, const CapabilityEntry &) = default;
};

/**
 * Name -> optional value. Built once per negotiation and treated as
 * read-only afterwards. Order of insertion is not kept; to_string() emits
 * known capabilities in enum order followed by extensions sorted by name.
 */
class CapabilitySet {
public:
  CapabilitySet() = default;

  void set(Capability cap, std::optional<std::string> value = std::nullopt);
  void set(std::string_view name, std::optional<std::string> value = std::nullopt);
  void erase(Capability cap);

  [[nodiscard]] auto has(Capability cap) const -> bool;
  [[nodiscard]] auto has(std::string_view name) const -> bool;
  [[nodiscard]] auto value(Capability cap) const -> std::optional<std::string>;
  [[nodiscard]] auto value(std::string_view name) const -> std::optional<std::string>;

  [[nodiscard]] auto size() const -> std::size_t { return known_.size() + extensions_.size(); }
  [[nodiscard]] auto empty() const -> bool { return size() == 0; }

  [[nodiscard]] auto entries() const -> std::vector<CapabilityEntry>;
  // Space separated, as sent after the NUL of the first ref line.
  [[nodiscard]] auto to_string() const -> std::string;

  friend bool operator==(const CapabilitySet &, const CapabilitySet &) = default;

private:
  std::map<Capability, std::optional<std::string>> known_;
  std::map<std::string, std::optional<std::string>, std::less<>> extensions_;
};

namespace capabilities {

/**
 * Parse "name name=value ..." (whitespace separated). Fails with
 * CapabilityError on an empty name ("=x") or a NUL byte inside a token.
 */
Result<CapabilitySet> parse(std::string_view caps);

// Parse into ordered entries (client preference lists).
Result<std::vector<CapabilityEntry>> parse_entries(std::string_view caps);

struct RefLineCaps {
  std::string sha;
  std::string name;
  std::optional<CapabilitySet> capabilities; // first line only
};

/**
 * Split one protocol v1 ref advertisement line ("<sha> <name>[\0caps]\n").
 * The first advertised line must carry a NUL; its absence is an error.
 */
Result<RefLineCaps> parse_from_ref_line(std::string_view line, bool is_first_ref);

/**
 * Entries of `client_prefs` (with the client's own values) whose name the
 * server advertises, in the client's order.
 */
std::vector<CapabilityEntry> select_common(const CapabilitySet &server,
                                           const std::vector<CapabilityEntry> &client_prefs);

// Names from `required` that `caps` lacks. Caller decides whether that is fatal.
std::vector<std::string> validate_required(const CapabilitySet &caps,
                                           const std::vector<std::string> &required);

// Protocol v2 advertisement: "version 2" followed by one capability per line,
// agent, ls-refs, fetch, server-option and object-format leading.
std::vector<std::string> build_v2_lines(const CapabilitySet &caps);
Result<CapabilitySet> parse_v2_lines(const std::vector<std::string> &lines);

/**
 * Version requested through the "version=N" extra parameter
 * (GIT_PROTOCOL env or git-daemon extra args, colon separated).
 * Falls back to V0 when absent or unsupported.
 */
ProtocolVersion requested_version(std::string_view extra_parameters);

} // namespace capabilities

} // namespace gitwire
