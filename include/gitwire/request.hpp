#pragma once
#include "gitwire/capabilities.hpp"
#include "gitwire/error.hpp"
#include "gitwire/pkt_line.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

struct WantLine {
  std::string sha;
  std::vector<CapabilityEntry> capabilities; // only on the first want (v1)
};

// Everything a client sent for one fetch. Ids are lowercase hex.
struct FetchRequest {
  std::vector<std::string> wants;
  std::vector<CapabilityEntry> capabilities; // v1: first want line
  std::vector<std::string> haves;
  std::vector<std::string> shallow;          // commits that are shallow on the client
  std::optional<std::uint32_t> depth;
  std::optional<std::int64_t> deepen_since;
  std::vector<std::string> deepen_not;
  bool deepen_relative = false;
  std::optional<std::string> filter;
  bool done = false;

  // protocol v2 fetch arguments
  bool thin_pack = false;
  bool no_progress = false;
  bool include_tag = false;
  bool ofs_delta = false;
  bool wait_for_done = false;

  // v1 capability from the want line, or the matching v2 argument
  [[nodiscard]] bool wants_capability(Capability cap) const;
};

// A protocol v2 command: "command=<name>", capability lines, delim, arguments, flush.
struct CommandRequest {
  std::string command;
  std::vector<CapabilityEntry> capabilities;
  std::vector<std::string> args; // trailing LF removed
};

namespace request {

// "want <sha>[ <caps>]"
Result<WantLine> parse_want(std::string_view line);
// "have <sha>", "shallow <sha>"
Result<std::string> parse_have(std::string_view line);
Result<std::string> parse_shallow(std::string_view line);

/**
 * Fold one request line into `req`. Handles want, have, shallow, deepen,
 * deepen-since, deepen-not, deepen-relative, filter and done; v2 adds the
 * bare fetch arguments. Unknown lines fail with NegotiationError.
 */
Status apply_line(FetchRequest &req, std::string_view line, bool v2);

/**
 * A whole v1 upload request as sent in one stateless HTTP body: want/shallow/
 * deepen lines, flush, then have lines with optional flushes and "done".
 */
Result<FetchRequest> parse_v1(const std::vector<pktline::Packet> &packets);

// Arguments of a v2 "command=fetch" request.
Result<FetchRequest> parse_v2_fetch(const std::vector<std::string> &args);

// Split a v2 command request (packets up to and including its flush).
Result<CommandRequest> parse_command(const std::vector<pktline::Packet> &packets);

} // namespace request

} // namespace gitwire
