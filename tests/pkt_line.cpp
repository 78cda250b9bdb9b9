#include "gitwire/pkt_line.hpp"
#include "gitwire/util.hpp"

#include <iostream>
#include <string>

using namespace gitwire;

int main() {
  // "want " + 40 hex + LF is 46 bytes, 50 with the header
  {
    const std::string line = "want " + std::string(40, 'a') + "\n";
    const auto enc = pktline::encode(line);
    const std::string got(enc.begin(), enc.end());
    if (got != "0032" + line) { std::cerr << "want line framing: " << got << "\n"; return 1; }
  }

  // markers
  {
    const auto flush = pktline::decode(as_bytes("0000"));
    if (!flush || flush.value().packet->type != pktline::PacketType::Flush || flush.value().consumed != 4) {
      std::cerr << "flush decode\n"; return 1;
    }
    const auto delim = pktline::decode(as_bytes("0001rest"));
    if (!delim || delim.value().packet->type != pktline::PacketType::Delimiter || delim.value().consumed != 4) {
      std::cerr << "delimiter decode\n"; return 1;
    }
    const auto end = pktline::decode(as_bytes("0002"));
    if (!end || end.value().packet->type != pktline::PacketType::ResponseEnd) {
      std::cerr << "response-end decode\n"; return 1;
    }
    std::vector<std::uint8_t> markers;
    pktline::append_delimiter(markers);
    pktline::append_response_end(markers);
    pktline::append_flush(markers);
    if (as_text(markers) != "000100020000") { std::cerr << "marker encoding\n"; return 1; }
    const auto reserved = pktline::decode(as_bytes("0003"));
    if (reserved || reserved.kind() != ErrorKind::ProtocolFraming) { std::cerr << "0003 accepted\n"; return 1; }
  }

  // incomplete input is not an error and consumes nothing
  {
    const auto partial = pktline::decode(as_bytes("0005"));
    if (!partial || !partial.value().incomplete() || partial.value().consumed != 0) {
      std::cerr << "short payload should be incomplete\n"; return 1;
    }
    const auto header = pktline::decode(as_bytes("00"));
    if (!header || !header.value().incomplete()) { std::cerr << "short header should be incomplete\n"; return 1; }
    const auto a = pktline::decode(as_bytes("0005a"));
    if (!a || a.value().incomplete() || a.value().packet->text() != "a") {
      std::cerr << "one-byte payload\n"; return 1;
    }
    const auto b = pktline::decode(as_bytes("0006a"));
    if (!b || !b.value().incomplete() || b.value().consumed != 0) {
      std::cerr << "0006a should be incomplete\n"; return 1;
    }
  }

  // framing errors
  {
    if (pktline::decode(as_bytes("00zzabc")).kind() != ErrorKind::ProtocolFraming) {
      std::cerr << "bad hex accepted\n"; return 1;
    }
    if (pktline::decode(as_bytes("fff1")).kind() != ErrorKind::ProtocolFraming) {
      std::cerr << "oversize length accepted\n"; return 1;
    }
    bool threw = false;
    try {
      (void)pktline::encode(std::string(65517, 'x'));
    } catch (const Error &e) {
      threw = e.kind() == ErrorKind::ProtocolFraming;
    }
    if (!threw) { std::cerr << "oversize encode did not throw\n"; return 1; }
    const auto max = pktline::encode(std::string(65516, 'x'));
    if (max.size() != 65520 || std::string(max.begin(), max.begin() + 4) != "fff0") {
      std::cerr << "maximum packet\n"; return 1;
    }
  }

  // stream decode keeps the tail of a partial packet
  {
    const auto s = pktline::decode_stream(as_bytes("0009hello0000000bwor"));
    if (!s || s.value().packets.size() != 2) { std::cerr << "stream packet count\n"; return 1; }
    if (s.value().packets[0].text() != "hello" || s.value().packets[1].type != pktline::PacketType::Flush) {
      std::cerr << "stream packets\n"; return 1;
    }
    if (as_text(s.value().remaining) != "000bwor") { std::cerr << "stream remainder\n"; return 1; }
  }

  // Reader reassembles packets fed one byte at a time
  {
    const std::string wire = "000ccommand\n00000008abcd";
    pktline::Reader reader;
    std::vector<pktline::Packet> got;
    for (char c : wire) {
      const auto byte = static_cast<std::uint8_t>(c);
      reader.feed(std::span(&byte, 1));
      while (true) {
        auto next = reader.next();
        if (!next) { std::cerr << "reader error: " << next.status().message << "\n"; return 1; }
        if (!next.value()) break;
        got.push_back(std::move(*next.value()));
      }
    }
    if (got.size() != 3 || got[0].text() != "command\n" || got[1].type != pktline::PacketType::Flush ||
        got[2].text() != "abcd" || reader.buffered() != 0) {
      std::cerr << "reader reassembly\n"; return 1;
    }

    pktline::Reader bad;
    bad.feed(as_bytes("xx00"));
    if (bad.next().kind() != ErrorKind::ProtocolFraming) { std::cerr << "reader framing error\n"; return 1; }
    bad.feed(as_bytes("0000"));
    if (bad.next().kind() != ErrorKind::ProtocolFraming) { std::cerr << "reader must stay failed\n"; return 1; }
  }

  // binary payloads survive a round trip
  {
    std::vector<std::uint8_t> payload;
    for (int i = 0; i < 1000; ++i) payload.push_back(static_cast<std::uint8_t>(i * 7));
    const auto enc = pktline::encode(payload);
    const auto dec = pktline::decode(enc);
    if (!dec || dec.value().packet->payload != payload || dec.value().consumed != enc.size()) {
      std::cerr << "binary round trip\n"; return 1;
    }
  }

  std::cout << "pkt-line OK\n";
  return 0;
}
