#include "gitwire/pack_validate.hpp"
#include "gitwire/upload_pack.hpp"

#include "upload_fixture.hpp"

#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace gitwire;
using fixture::parse_response;

namespace {

UploadPackOptions v2(bool stateless) {
  UploadPackOptions o;
  o.version = ProtocolVersion::V2;
  o.stateless_rpc = stateless;
  return o;
}

// command=fetch with the given arguments
std::vector<std::uint8_t> fetch(std::vector<std::string> args) {
  std::vector<std::string> lines{"command=fetch\n", "agent=git/2.43.0\n", "object-format=sha1\n", "<delim>"};
  for (auto &a : args)
    lines.push_back(std::move(a) + "\n");
  lines.emplace_back("<flush>");
  return fixture::request(lines);
}

} // namespace

int main() {
  const auto repo = fixture::make_repo();
  const auto &c = repo.commits;
  const auto &store = repo.store;

  // capability advertisement
  {
    UploadPack up(store, v2(false));
    MemoryConnection conn({});
    if (!up.serve(conn)) { std::cerr << "empty session\n"; return 1; }
    const auto dec = pktline::decode_stream(conn.output());
    if (!dec) { std::cerr << "advertisement framing\n"; return 1; }
    std::vector<std::string> lines;
    for (const auto &p : dec.value().packets)
      lines.emplace_back(p.is_data() ? std::string(p.text()) : "<flush>");
    const std::vector<std::string> expect{"version 2\n", "agent=" + default_server_config().agent + "\n",
                                          "ls-refs=unborn\n", "fetch=shallow wait-for-done\n",
                                          "server-option\n", "object-format=sha1\n", "<flush>"};
    if (lines != expect) {
      std::cerr << "v2 advertisement:\n";
      for (const auto &l : lines)
        std::cerr << "  " << l;
      return 1;
    }

    UploadPackOptions off = v2(false);
    off.config.protocol_v2 = false;
    if (as_text(UploadPack(store, off).advertisement()).find("version 2") != std::string_view::npos) {
      std::cerr << "v2 disabled in config\n"; return 1;
    }
  }

  // ls-refs, then a second command on the same connection
  {
    UploadPack up(store, v2(false));
    auto in = fixture::request({"command=ls-refs\n", "<delim>", "symrefs\n", "peel\n", "ref-prefix refs/tags/\n", "<flush>",
                       "command=ls-refs\n", "<delim>", "ref-prefix refs/heads/\n", "<flush>"});
    MemoryConnection conn(in, 5);
    if (auto st = up.serve(conn); !st) { std::cerr << "ls-refs: " << st.message << "\n"; return 1; }
    const auto out = as_text(conn.output());
    const auto tags = out.find(repo.tag + " refs/tags/v1 peeled:" + c[1] + "\n");
    const auto heads = out.find(c[2] + " refs/heads/main\n");
    if (tags == std::string_view::npos || heads == std::string_view::npos || heads < tags ||
        out.find(" HEAD") != std::string_view::npos) {
      std::cerr << "ls-refs output\n"; return 1;
    }
  }

  // fetch with done: straight to the packfile section
  {
    UploadPack up(store, v2(true));
    const auto out = up.handle_request(fetch({"want " + c[2], "ofs-delta", "done"}));
    if (!out) { std::cerr << "fetch done: " << out.status().message << "\n"; return 1; }
    const auto r = parse_response(out.value());
    if (!r.ok || r.lines != std::vector<std::string>{"packfile\n"}) { std::cerr << "packfile section\n"; return 1; }
    const auto v = pack::validate_pack_integrity(r.demux.pack_data);
    if (!v.valid || v.parsed_objects != 10 || r.demux.progress.empty()) { std::cerr << "v2 clone pack\n"; return 1; }
  }

  // nothing in common yet: acknowledgments with NAK, no pack
  {
    UploadPack up(store, v2(true));
    const auto out = up.handle_request(fetch({"want " + c[2], "have " + std::string(40, 'e')}));
    const auto r = out ? parse_response(out.value()) : fixture::Response{};
    const std::vector<std::string> expect{"acknowledgments\n", "NAK\n", "<flush>"};
    if (!out || r.lines != expect || r.has_pack) { std::cerr << "NAK round\n"; return 1; }
  }

  // a common have covering the want: ready and the pack in one response
  {
    UploadPack up(store, v2(true));
    const auto out = up.handle_request(fetch({"want " + c[2], "have " + c[1], "no-progress"}));
    if (!out) { std::cerr << "ready: " << out.status().message << "\n"; return 1; }
    const auto r = parse_response(out.value());
    const std::vector<std::string> expect{"acknowledgments\n", "ACK " + c[1] + "\n", "ready\n", "<delim>",
                                          "packfile\n"};
    if (!r.ok || r.lines != expect || !r.demux.progress.empty()) { std::cerr << "ready sections\n"; return 1; }
    const auto v = pack::validate_pack_integrity(r.demux.pack_data);
    const std::set<std::string> ids(v.object_ids.begin(), v.object_ids.end());
    if (!v.valid || ids != std::set<std::string>{c[2], repo.trees[2], repo.apps[2]}) { std::cerr << "ready pack\n"; return 1; }
  }

  // wait-for-done holds the pack back even when ready
  {
    UploadPack up(store, v2(true));
    const auto out = up.handle_request(fetch({"want " + c[2], "have " + c[1], "wait-for-done"}));
    const auto r = out ? parse_response(out.value()) : fixture::Response{};
    const std::vector<std::string> expect{"acknowledgments\n", "ACK " + c[1] + "\n", "<flush>"};
    if (!out || r.lines != expect) { std::cerr << "wait-for-done\n"; return 1; }
  }

  // shallow-info between the acknowledgments and the packfile
  {
    UploadPack up(store, v2(true));
    const auto out = up.handle_request(fetch({"want " + c[2], "deepen 2", "done"}));
    if (!out) { std::cerr << "deepen: " << out.status().message << "\n"; return 1; }
    const auto r = parse_response(out.value());
    const std::vector<std::string> expect{"shallow-info\n", "shallow " + c[1] + "\n", "<delim>", "packfile\n"};
    if (!r.ok || r.lines != expect) { std::cerr << "shallow-info\n"; return 1; }
    if (pack::validate_pack_integrity(r.demux.pack_data).parsed_objects != 7) { std::cerr << "depth 2 pack\n"; return 1; }
  }

  // include-tag
  {
    UploadPack up(store, v2(true));
    const auto out = up.handle_request(fetch({"want " + c[2], "include-tag", "done"}));
    const auto r = out ? parse_response(out.value()) : fixture::Response{};
    const auto v = pack::validate_pack_integrity(r.demux.pack_data);
    if (!out || v.parsed_objects != 11) { std::cerr << "v2 include-tag\n"; return 1; }
  }

  // errors
  {
    const auto fails = [&](const std::vector<std::uint8_t> &body, ErrorKind kind) {
      UploadPack up(store, v2(true));
      MemoryConnection conn(body);
      const auto st = up.serve(conn);
      return !st && st.kind == kind && as_text(conn.output()).substr(4).starts_with("ERR ");
    };
    if (!fails(fixture::request({"command=push\n", "<flush>"}), ErrorKind::CapabilityError)) {
      std::cerr << "unknown command\n"; return 1;
    }
    if (!fails(fixture::request({"agent=git/2.43.0\n", "<flush>"}), ErrorKind::CapabilityError)) {
      std::cerr << "missing command\n"; return 1;
    }
    if (!fails(fixture::request({"command=ls-refs\n", "<delim>", "frobnicate\n", "<flush>"}), ErrorKind::NegotiationError)) {
      std::cerr << "bad ls-refs argument\n"; return 1;
    }
    if (!fails(fetch({"want " + std::string(40, 'e'), "done"}), ErrorKind::NegotiationError)) {
      std::cerr << "unknown want\n"; return 1;
    }
    if (!fails(fetch({"want " + c[2], "filter blob:none", "done"}), ErrorKind::CapabilityError)) {
      std::cerr << "filter\n"; return 1;
    }
    if (!fails(fetch({"want " + c[2], "sideways", "done"}), ErrorKind::NegotiationError)) {
      std::cerr << "unknown fetch argument\n"; return 1;
    }
  }

  std::cout << "upload-pack v2 OK\n";
  return 0;
}
