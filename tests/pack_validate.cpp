#include "gitwire/pack.hpp"
#include "gitwire/pack_format.hpp"
#include "gitwire/pack_validate.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/util.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace gitwire;

static pack::PackableObject blob(const std::string &text) {
  pack::PackableObject o;
  o.type = ObjectType::Blob;
  o.data.assign(text.begin(), text.end());
  o.sha = object_id("blob", o.data);
  return o;
}

static std::string text(int lines) {
  std::string s;
  for (int i = 0; i < lines; ++i)
    s += std::to_string(i) + " lorem ipsum dolor sit amet, consectetur adipiscing elit\n";
  return s;
}

// Recompute the trailer after tampering with the body.
static void reseal(std::vector<std::uint8_t> &bytes) {
  const oid sum = sha1(std::span(bytes).first(bytes.size() - 20));
  std::copy(sum.begin(), sum.end(), bytes.end() - 20);
}

int main() {
  const auto res = pack::generate({blob(text(30)), blob(text(34)), blob(text(38)), blob("unrelated\n")}, {});
  if (!res) { std::cerr << "generate: " << res.status().message << "\n"; return 1; }
  const auto good = res.value().bytes;

  // intact pack
  {
    const auto v = pack::validate_pack_integrity(good);
    if (!v.valid || !v.header_valid || !v.checksum_valid) { std::cerr << "good pack rejected\n"; return 1; }
    if (v.declared_objects != 4 || v.parsed_objects != 4 || v.object_ids.size() != 4) {
      std::cerr << "object counts\n"; return 1;
    }
    if (v.chains.chain_count != 2 || v.chains.max_depth < 1 || v.chains.average_depth < 1.0) {
      std::cerr << "chain stats\n"; return 1;
    }

    pack::ValidateOptions shallow_walk;
    shallow_walk.walk_deltas = false;
    const auto w = pack::validate_pack_integrity(good, shallow_walk);
    if (!w.valid || w.object_ids.size() != 2 || w.chains.chain_count != 0) {
      std::cerr << "walk_deltas=false\n"; return 1;
    }
  }

  // flipped trailer byte
  {
    auto bad = good;
    bad.back() ^= 0xff;
    const auto v = pack::validate_pack_integrity(bad);
    if (v.valid || v.checksum_valid || !v.header_valid) { std::cerr << "checksum corruption missed\n"; return 1; }
  }

  // flipped byte inside an entry, trailer recomputed
  {
    auto bad = good;
    bad[bad.size() - 30] ^= 0x55;
    reseal(bad);
    const auto v = pack::validate_pack_integrity(bad);
    if (v.valid || !v.checksum_valid) { std::cerr << "entry corruption missed\n"; return 1; }
  }

  // bad signature and version
  {
    auto bad = good;
    bad[0] = 'J';
    reseal(bad);
    const auto sig = pack::validate_pack_integrity(bad);
    if (sig.valid || sig.header_valid) { std::cerr << "bad signature accepted\n"; return 1; }

    bad = good;
    bad[7] = 9;
    reseal(bad);
    const auto ver = pack::validate_pack_integrity(bad);
    if (ver.valid || ver.header_valid) { std::cerr << "version 9 accepted\n"; return 1; }
  }

  // truncated packs
  {
    const std::vector<std::uint8_t> tiny(good.begin(), good.begin() + 10);
    if (pack::validate_pack_integrity(tiny).valid) { std::cerr << "10-byte pack accepted\n"; return 1; }

    std::vector<std::uint8_t> cut(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(good.size() / 2));
    cut.resize(cut.size() + 20);
    reseal(cut);
    const auto v = pack::validate_pack_integrity(cut);
    if (v.valid || v.parsed_objects >= 4) { std::cerr << "truncated pack accepted\n"; return 1; }
  }

  // declared count larger than the contents
  {
    auto bad = good;
    bad[11] = 5;
    reseal(bad);
    const auto v = pack::validate_pack_integrity(bad);
    if (v.valid || v.declared_objects != 5 || v.parsed_objects != 4) { std::cerr << "count mismatch\n"; return 1; }
  }

  // trailing garbage between the last entry and the trailer
  {
    std::vector<std::uint8_t> bad(good.begin(), good.end() - 20);
    bad.push_back(0x00);
    bad.resize(bad.size() + 20);
    reseal(bad);
    const auto v = pack::validate_pack_integrity(bad);
    if (v.valid) { std::cerr << "trailing bytes accepted\n"; return 1; }
  }

  // OFS_DELTA pointing before the start of the pack
  {
    std::vector<std::uint8_t> bad;
    pack::format::append_header(bad, 1);
    pack::format::append_object_header(bad, ObjectType::OfsDelta, 3);
    pack::format::append_ofs_distance(bad, 500);
    const std::vector<std::uint8_t> d = {0x00, 0x00, 0x00};
    const auto z = fs::z_compress(d);
    bad.insert(bad.end(), z.begin(), z.end());
    bad.resize(bad.size() + 20);
    reseal(bad);
    const auto v = pack::validate_pack_integrity(bad);
    if (v.valid || !v.checksum_valid) { std::cerr << "wild ofs distance accepted\n"; return 1; }
  }

  std::cout << "pack validate OK\n";
  return 0;
}
