#pragma once
#include "gitwire/capabilities.hpp"
#include "gitwire/error.hpp"
#include "gitwire/refs.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire::refadv {

/**
 * Protocol v0/v1 ref advertisement, terminated by a flush packet.
 *
 * The first line carries the capability list after a NUL; annotated tags get
 * an extra "<peeled> <name>^{}" line. With no refs at all a single
 * "<zero-id> capabilities^{}" line carries the capabilities. Refs are
 * written in the order given.
 */
std::vector<std::uint8_t> advertise(const std::vector<RefLine> &refs, const CapabilitySet &caps);

// Smart-HTTP preamble: "# service=<name>\n" followed by a flush.
std::vector<std::uint8_t> service_header(std::string_view service);

// Protocol v2 capability advertisement ("version 2", one per line, flush).
std::vector<std::uint8_t> advertise_v2(const CapabilitySet &caps);

struct LsRefsOptions {
  bool peel = false;
  bool symrefs = false;
  bool unborn = false;
  std::vector<std::string> ref_prefixes; // empty: every ref
};

/**
 * Protocol v2 ls-refs response: "<sha> <name>[ symref-target:<t>][ peeled:<sha>]"
 * per ref, then a flush. `head_target` is the symbolic target of HEAD.
 */
std::vector<std::uint8_t> ls_refs(const std::vector<RefLine> &refs,
                                  const std::optional<std::string> &head_target,
                                  const LsRefsOptions &opts);

struct Advertisement {
  std::vector<RefLine> refs; // peel lines folded into RefLine::peeled
  CapabilitySet capabilities;
};

/**
 * Read a v1 advertisement back (up to and including the flush). The
 * capabilities^{} pseudo-ref of an empty repository yields no refs.
 */
Result<Advertisement> parse_advertisement(std::span<const std::uint8_t> bytes);

} // namespace gitwire::refadv
