#include "gitwire/delta.hpp"
#include "gitwire/util.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace gitwire;

static std::vector<std::uint8_t> bytes_of(const std::string &s) { return {s.begin(), s.end()}; }

int main() {
  // hand-built delta: copy "Hello, " then insert "Universe!"
  {
    const std::string base = "Hello, World!";
    const std::string target = "Hello, Universe!";
    std::vector<std::uint8_t> d;
    delta::append_varint(d, base.size());
    delta::append_varint(d, target.size());
    delta::append_instruction(d, delta::Copy{0, 7});
    delta::append_instruction(d, delta::Insert{bytes_of("Universe!")});

    const auto out = delta::apply_delta(as_bytes(base), d);
    if (!out || as_text(out.value()) != target) { std::cerr << "apply hand-built delta\n"; return 1; }

    const auto ins = delta::parse_instructions(d);
    if (!ins || ins.value().size() != 2) { std::cerr << "parse_instructions count\n"; return 1; }
    if (std::get<delta::Copy>(ins.value()[0]) != delta::Copy{0, 7}) { std::cerr << "copy decode\n"; return 1; }
    if (std::get<delta::Insert>(ins.value()[1]).bytes != bytes_of("Universe!")) {
      std::cerr << "insert decode\n"; return 1;
    }
  }

  // generated delta reproduces the target and copies the shared prefix
  {
    const std::string base = "Hello, World!";
    const std::string target = "Hello, Universe!";
    const auto d = delta::create_delta(as_bytes(base), as_bytes(target));
    const auto out = delta::apply_delta(as_bytes(base), d);
    if (!out || as_text(out.value()) != target) { std::cerr << "create/apply small\n"; return 1; }
    const auto ins = delta::parse_instructions(d);
    if (!ins || ins.value().empty() || !std::holds_alternative<delta::Copy>(ins.value().front())) {
      std::cerr << "expected a leading copy\n"; return 1;
    }
  }

  // larger text: the delta is much smaller than the target
  {
    std::string base;
    for (int i = 0; i < 200; ++i)
      base += "line " + std::to_string(i) + " of a fairly ordinary text file\n";
    std::string target = base;
    target.replace(target.find("line 100 "), 8, "LINE 100");
    target += "one more line at the end\n";
    const auto d = delta::create_delta(as_bytes(base), as_bytes(target));
    const auto out = delta::apply_delta(as_bytes(base), d);
    if (!out || as_text(out.value()) != target) { std::cerr << "create/apply large\n"; return 1; }
    if (d.size() * 10 > target.size()) { std::cerr << "delta too large: " << d.size() << "\n"; return 1; }
  }

  // copy [100, +50) against a 120-byte base
  {
    const std::vector<std::uint8_t> base(120, 'x');
    std::vector<std::uint8_t> d;
    delta::append_varint(d, 120);
    delta::append_varint(d, 50);
    delta::append_instruction(d, delta::Copy{100, 50});
    const auto out = delta::apply_delta(base, d);
    if (out || out.kind() != ErrorKind::DeltaError) { std::cerr << "out-of-bounds copy accepted\n"; return 1; }
  }

  // declared source size must match the base
  {
    const std::string base = "abcdef";
    std::vector<std::uint8_t> d;
    delta::append_varint(d, 7);
    delta::append_varint(d, 3);
    delta::append_instruction(d, delta::Copy{0, 3});
    const auto out = delta::apply_delta(as_bytes(base), d);
    if (out || out.kind() != ErrorKind::DeltaError) { std::cerr << "source size mismatch accepted\n"; return 1; }
  }

  // output shorter than the declared target size
  {
    const std::string base = "abcdef";
    std::vector<std::uint8_t> d;
    delta::append_varint(d, 6);
    delta::append_varint(d, 10);
    delta::append_instruction(d, delta::Copy{0, 6});
    const auto out = delta::apply_delta(as_bytes(base), d);
    if (out || out.kind() != ErrorKind::DeltaError) { std::cerr << "short output accepted\n"; return 1; }
  }

  // opcode 0 is reserved
  {
    const std::string base = "abcdef";
    std::vector<std::uint8_t> d;
    delta::append_varint(d, 6);
    delta::append_varint(d, 1);
    d.push_back(0x00);
    const auto out = delta::apply_delta(as_bytes(base), d);
    if (out || out.kind() != ErrorKind::DeltaError) { std::cerr << "opcode 0 accepted\n"; return 1; }
    if (delta::parse_instructions(d)) { std::cerr << "parse accepted opcode 0\n"; return 1; }
  }

  // truncated insert
  {
    std::vector<std::uint8_t> d;
    delta::append_varint(d, 0);
    delta::append_varint(d, 5);
    d.push_back(0x05);
    d.push_back('a');
    const auto out = delta::apply_delta({}, d);
    if (out || out.kind() != ErrorKind::DeltaError) { std::cerr << "truncated insert accepted\n"; return 1; }
  }

  // copy size 0 on the wire means 0x10000
  {
    const std::vector<std::uint8_t> d = {0x80, 0x80, 0x04, 0x80, 0x80, 0x04, 0x80};
    const auto ins = delta::parse_instructions(d);
    if (!ins || ins.value().size() != 1 ||
        std::get<delta::Copy>(ins.value()[0]) != delta::Copy{0, delta::kMaxCopy}) {
      std::cerr << "implicit copy size\n"; return 1;
    }
  }

  // varints
  {
    const auto small = delta::encode_varint(127);
    if (small != std::vector<std::uint8_t>{0x7f}) { std::cerr << "varint 127\n"; return 1; }
    const auto two = delta::encode_varint(128);
    if (two != std::vector<std::uint8_t>{0x80, 0x01}) { std::cerr << "varint 128\n"; return 1; }

    const std::uint64_t big = (std::uint64_t{1} << 35) - 1;
    const auto enc = delta::encode_varint(big);
    if (enc.size() != 5) { std::cerr << "2^35-1 should take 5 bytes\n"; return 1; }
    const auto dec = delta::parse_varint(enc);
    if (!dec || dec.value().value != big || dec.value().bytes_read != 5) { std::cerr << "2^35-1 decode\n"; return 1; }

    const auto max = delta::encode_varint(~std::uint64_t{0});
    if (max.size() != delta::kMaxVarintLen) { std::cerr << "u64 max length\n"; return 1; }
    const auto max_dec = delta::parse_varint(max);
    if (!max_dec || max_dec.value().value != ~std::uint64_t{0}) { std::cerr << "u64 max decode\n"; return 1; }

    // offset into a larger buffer
    std::vector<std::uint8_t> buf = {0xff, 0xff};
    delta::append_varint(buf, 300);
    const auto at = delta::parse_varint(buf, 2);
    if (!at || at.value().value != 300 || at.value().bytes_read != 2) { std::cerr << "varint at offset\n"; return 1; }

    const std::vector<std::uint8_t> too_long(11, 0x80);
    if (delta::parse_varint(too_long)) { std::cerr << "11-byte varint accepted\n"; return 1; }
    const std::vector<std::uint8_t> truncated = {0x80, 0x80};
    const auto t = delta::parse_varint(truncated);
    if (t || t.kind() != ErrorKind::DeltaError) { std::cerr << "truncated varint accepted\n"; return 1; }
  }

  // encoder rejects what the format cannot express
  {
    std::vector<std::uint8_t> out;
    try {
      delta::append_instruction(out, delta::Insert{std::vector<std::uint8_t>(128, 'a')});
      std::cerr << "128-byte insert encoded\n";
      return 1;
    } catch (const Error &e) {
      if (e.kind() != ErrorKind::DeltaError) { std::cerr << "wrong kind\n"; return 1; }
    }
  }

  // empty target
  {
    const std::string base = "something";
    const auto d = delta::create_delta(as_bytes(base), {});
    const auto out = delta::apply_delta(as_bytes(base), d);
    if (!out || !out.value().empty()) { std::cerr << "empty target\n"; return 1; }
  }

  std::cout << "delta OK\n";
  return 0;
}
