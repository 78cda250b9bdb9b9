#include "gitwire/pkt_line.hpp"
#include "gitwire/request.hpp"
#include "gitwire/util.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace gitwire;

static pktline::Packet line(const std::string &s) { return pktline::Packet::data(as_bytes(s)); }

int main() {
  const std::string a(40, 'a');
  const std::string b(40, 'b');
  const std::string c(40, 'c');

  // single lines
  {
    const auto w = request::parse_want("want " + a + " multi_ack_detailed side-band-64k ofs-delta\n");
    if (!w || w.value().sha != a || w.value().capabilities.size() != 3) { std::cerr << "want with caps\n"; return 1; }
    const auto upper = request::parse_want("want " + std::string(40, 'A'));
    if (!upper || upper.value().sha != a) { std::cerr << "ids are lowercased\n"; return 1; }
    const auto short_id = request::parse_want("want abc123");
    if (short_id || short_id.kind() != ErrorKind::NegotiationError) { std::cerr << "short id accepted\n"; return 1; }
    const auto have = request::parse_have("have " + b + "\n");
    if (!have || have.value() != b) { std::cerr << "have\n"; return 1; }
    if (request::parse_have("have " + b + " extra")) { std::cerr << "have with junk accepted\n"; return 1; }
    const auto sh = request::parse_shallow("shallow " + c);
    if (!sh || sh.value() != c) { std::cerr << "shallow\n"; return 1; }
  }

  // a stateless v1 body
  {
    const std::vector<pktline::Packet> body = {
        line("want " + a + " multi_ack_detailed side-band-64k thin-pack ofs-delta agent=git/2.43\n"),
        line("want " + b + "\n"),
        line("want " + a + "\n"),
        line("shallow " + c + "\n"),
        line("deepen 3\n"),
        pktline::Packet::flush(),
        line("have " + c + "\n"),
        pktline::Packet::flush(),
        line("have " + b + "\n"),
        line("done\n"),
        line("have " + a + "\n"), // after done: ignored
    };
    const auto req = request::parse_v1(body);
    if (!req) { std::cerr << "parse_v1: " << req.status().message << "\n"; return 1; }
    const auto &r = req.value();
    if (r.wants != std::vector<std::string>{a, b}) { std::cerr << "wants (duplicates dropped)\n"; return 1; }
    if (r.haves != std::vector<std::string>{c, b}) { std::cerr << "haves\n"; return 1; }
    if (r.shallow != std::vector<std::string>{c} || r.depth != 3u || !r.done) { std::cerr << "shallow/depth/done\n"; return 1; }
    if (!r.wants_capability(Capability::ThinPack) || !r.wants_capability(Capability::SideBand64k) ||
        r.wants_capability(Capability::NoProgress)) {
      std::cerr << "capabilities from the first want\n"; return 1;
    }
  }

  // ordering mistakes in v1
  {
    const auto early_have = request::parse_v1({line("have " + a + "\n")});
    if (early_have || early_have.kind() != ErrorKind::NegotiationError) { std::cerr << "have before wants\n"; return 1; }
    const auto late_want = request::parse_v1({line("want " + a + "\n"), pktline::Packet::flush(), line("want " + b + "\n")});
    if (late_want) { std::cerr << "want after flush accepted\n"; return 1; }
    const auto delim = request::parse_v1({line("want " + a + "\n"), pktline::Packet::delimiter()});
    if (delim || delim.kind() != ErrorKind::ProtocolFraming) { std::cerr << "delimiter in v1\n"; return 1; }
    const auto unknown = request::parse_v1({line("wants " + a + "\n")});
    if (unknown) { std::cerr << "unknown line accepted\n"; return 1; }
  }

  // deepen variants
  {
    FetchRequest r;
    if (!request::apply_line(r, "deepen-since 1700000000\n", false) || r.deepen_since != 1700000000) {
      std::cerr << "deepen-since\n"; return 1;
    }
    if (!request::apply_line(r, "deepen-not refs/heads/old\n", false) || r.deepen_not != std::vector<std::string>{"refs/heads/old"}) {
      std::cerr << "deepen-not\n"; return 1;
    }
    if (!request::apply_line(r, "deepen-relative\n", false) || !r.deepen_relative) { std::cerr << "deepen-relative\n"; return 1; }
    if (request::apply_line(r, "deepen 0\n", false)) { std::cerr << "deepen 0 accepted\n"; return 1; }
    if (request::apply_line(r, "deepen-since soon\n", false)) { std::cerr << "deepen-since junk accepted\n"; return 1; }
    if (!request::apply_line(r, "filter blob:none\n", false) || r.filter != std::optional<std::string>("blob:none")) {
      std::cerr << "filter\n"; return 1;
    }
    // v2 argument words are not v1 lines
    if (request::apply_line(r, "thin-pack\n", false)) { std::cerr << "bare thin-pack in v1\n"; return 1; }
  }

  // v2 fetch arguments
  {
    const auto req = request::parse_v2_fetch({"thin-pack", "ofs-delta", "no-progress", "include-tag",
                                              "wait-for-done", "want " + a, "have " + b, "done"});
    if (!req) { std::cerr << "parse_v2_fetch: " << req.status().message << "\n"; return 1; }
    const auto &r = req.value();
    if (!r.thin_pack || !r.ofs_delta || !r.no_progress || !r.include_tag || !r.wait_for_done || !r.done) {
      std::cerr << "v2 flags\n"; return 1;
    }
    if (!r.wants_capability(Capability::OfsDelta) || !r.capabilities.empty()) { std::cerr << "v2 capabilities\n"; return 1; }
    const auto caps_on_want = request::parse_v2_fetch({"want " + a + " ofs-delta"});
    if (caps_on_want) { std::cerr << "v2 want with capabilities accepted\n"; return 1; }
  }

  // v2 command framing
  {
    const std::vector<pktline::Packet> pkts = {
        line("command=fetch\n"), line("agent=git/2.43\n"), line("object-format=sha1\n"),
        pktline::Packet::delimiter(), line("want " + a + "\n"), line("done\n"), pktline::Packet::flush()};
    const auto cmd = request::parse_command(pkts);
    if (!cmd) { std::cerr << "parse_command: " << cmd.status().message << "\n"; return 1; }
    if (cmd.value().command != "fetch" || cmd.value().capabilities.size() != 2 ||
        cmd.value().args != std::vector<std::string>{"want " + a, "done"}) {
      std::cerr << "command contents\n"; return 1;
    }

    const auto no_cmd = request::parse_command({line("agent=x\n"), pktline::Packet::flush()});
    if (no_cmd || no_cmd.kind() != ErrorKind::CapabilityError) { std::cerr << "missing command=\n"; return 1; }
    const auto twice = request::parse_command({line("command=ls-refs\n"), line("command=fetch\n"), pktline::Packet::flush()});
    if (twice) { std::cerr << "command twice accepted\n"; return 1; }
    const auto two_delims = request::parse_command({line("command=fetch\n"), pktline::Packet::delimiter(),
                                                    pktline::Packet::delimiter(), pktline::Packet::flush()});
    if (two_delims || two_delims.kind() != ErrorKind::ProtocolFraming) { std::cerr << "second delimiter\n"; return 1; }
  }

  std::cout << "request OK\n";
  return 0;
}
