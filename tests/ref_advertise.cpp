#include "gitwire/pkt_line.hpp"
#include "gitwire/ref_advertiser.hpp"
#include "gitwire/util.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace gitwire;

static std::vector<std::string> lines_of(const std::vector<std::uint8_t> &bytes) {
  std::vector<std::string> out;
  const auto dec = pktline::decode_stream(bytes);
  if (!dec)
    return out;
  for (const auto &p : dec.value().packets)
    out.push_back(p.is_data() ? std::string(p.text()) : std::string("<flush>"));
  return out;
}

int main() {
  const std::string main_sha(40, 'a');
  const std::string tag_sha(40, 'b');
  const std::string feature_sha(40, 'c');

  const std::vector<RefLine> refs = {
      {main_sha, "HEAD", std::nullopt},
      {main_sha, "refs/heads/main", std::nullopt},
      {feature_sha, "refs/heads/topic", std::nullopt},
      {tag_sha, "refs/tags/v1.0", main_sha},
  };
  CapabilitySet caps;
  caps.set(Capability::MultiAckDetailed);
  caps.set(Capability::SideBand64k);
  caps.set(Capability::Symref, "HEAD:refs/heads/main");
  caps.set(Capability::Agent, "gitwire/test");

  // v1: caps after a NUL on the first line, peeled tag line
  {
    const auto bytes = refadv::advertise(refs, caps);
    const auto lines = lines_of(bytes);
    if (lines.size() != 6) { std::cerr << "v1 line count " << lines.size() << "\n"; return 1; }
    const std::string first = main_sha + " HEAD" + std::string(1, '\0') +
                              "multi_ack_detailed side-band-64k agent=gitwire/test symref=HEAD:refs/heads/main\n";
    if (lines[0] != first) { std::cerr << "first line: " << lines[0] << "\n"; return 1; }
    if (lines[1] != main_sha + " refs/heads/main\n") { std::cerr << "second line\n"; return 1; }
    if (lines[4] != main_sha + " refs/tags/v1.0^{}\n" || lines[5] != "<flush>") { std::cerr << "peeled line\n"; return 1; }

    const auto back = refadv::parse_advertisement(bytes);
    if (!back) { std::cerr << "parse_advertisement: " << back.status().message << "\n"; return 1; }
    if (back.value().refs != refs || !(back.value().capabilities == caps)) { std::cerr << "advertisement round trip\n"; return 1; }
  }

  // empty repository: capabilities^{} pseudo-ref
  {
    const auto bytes = refadv::advertise({}, caps);
    const auto lines = lines_of(bytes);
    if (lines.size() != 2 || !lines[0].starts_with(std::string(40, '0') + " capabilities^{}" + std::string(1, '\0'))) {
      std::cerr << "empty advertisement\n"; return 1;
    }
    const auto back = refadv::parse_advertisement(bytes);
    if (!back || !back.value().refs.empty() || !back.value().capabilities.has(Capability::SideBand64k)) {
      std::cerr << "empty advertisement parse\n"; return 1;
    }
  }

  // malformed advertisements
  {
    std::vector<std::uint8_t> no_nul;
    pktline::append_data(no_nul, main_sha + " HEAD\n");
    pktline::append_flush(no_nul);
    const auto a = refadv::parse_advertisement(no_nul);
    if (a || a.kind() != ErrorKind::CapabilityError) { std::cerr << "first line without NUL\n"; return 1; }

    std::vector<std::uint8_t> orphan_peel;
    pktline::append_data(orphan_peel, main_sha + " HEAD" + std::string(1, '\0') + "ofs-delta\n");
    pktline::append_data(orphan_peel, main_sha + " refs/tags/x^{}\n");
    pktline::append_flush(orphan_peel);
    if (refadv::parse_advertisement(orphan_peel)) { std::cerr << "peel line without tag\n"; return 1; }

    auto cut = refadv::advertise(refs, caps);
    cut.resize(cut.size() - 10);
    const auto t = refadv::parse_advertisement(cut);
    if (t || t.kind() != ErrorKind::ProtocolFraming) { std::cerr << "truncated advertisement\n"; return 1; }
  }

  // smart HTTP preamble
  {
    const auto hdr = refadv::service_header("git-upload-pack");
    if (as_text(hdr) != "001e# service=git-upload-pack\n0000") { std::cerr << "service header: " << as_text(hdr) << "\n"; return 1; }
  }

  // v2 capability advertisement
  {
    CapabilitySet v2;
    v2.set(Capability::Agent, "gitwire/test");
    v2.set(Capability::LsRefs, "unborn");
    v2.set(Capability::Fetch, "shallow wait-for-done");
    const auto lines = lines_of(refadv::advertise_v2(v2));
    const std::vector<std::string> expect{"version 2\n", "agent=gitwire/test\n", "ls-refs=unborn\n",
                                          "fetch=shallow wait-for-done\n", "<flush>"};
    if (lines != expect) { std::cerr << "v2 advertisement\n"; return 1; }
  }

  // ls-refs
  {
    refadv::LsRefsOptions opts;
    const auto plain = lines_of(refadv::ls_refs(refs, std::string("refs/heads/main"), opts));
    if (plain.size() != 5 || plain[0] != main_sha + " HEAD\n" || plain[3] != tag_sha + " refs/tags/v1.0\n") {
      std::cerr << "ls-refs plain\n"; return 1;
    }

    opts.peel = true;
    opts.symrefs = true;
    const auto rich = lines_of(refadv::ls_refs(refs, std::string("refs/heads/main"), opts));
    if (rich[0] != main_sha + " HEAD symref-target:refs/heads/main\n" ||
        rich[3] != tag_sha + " refs/tags/v1.0 peeled:" + main_sha + "\n") {
      std::cerr << "ls-refs peel/symrefs\n"; return 1;
    }

    opts.ref_prefixes = {"refs/heads/"};
    const auto heads = lines_of(refadv::ls_refs(refs, std::string("refs/heads/main"), opts));
    if (heads.size() != 3 || heads[0] != main_sha + " refs/heads/main\n") { std::cerr << "ls-refs prefix\n"; return 1; }

    refadv::LsRefsOptions unborn;
    unborn.unborn = true;
    unborn.symrefs = true;
    const auto empty = lines_of(refadv::ls_refs({}, std::string("refs/heads/main"), unborn));
    if (empty != std::vector<std::string>{"unborn HEAD symref-target:refs/heads/main\n", "<flush>"}) {
      std::cerr << "ls-refs unborn HEAD\n"; return 1;
    }
  }

  std::cout << "ref advertisement OK\n";
  return 0;
}
