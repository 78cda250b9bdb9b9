#include "gitwire/pkt_line.hpp"
#include "gitwire/sideband.hpp"
#include "gitwire/util.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace gitwire;

int main() {
  // one packet per channel
  {
    const auto pkt = sideband::wrap(sideband::Channel::Progress, "Counting objects: 3\n");
    const std::string got(pkt.begin(), pkt.end());
    if (got != "0019\x02" "Counting objects: 3\n") { std::cerr << "wrap: " << got << "\n"; return 1; }
  }

  // 64k chunking: 65515 data bytes per packet, 65520 on the wire
  {
    const std::vector<std::uint8_t> data(150000, 0xab);
    std::vector<std::uint8_t> out;
    sideband::append_chunked(out, sideband::Channel::PackData, data, sideband::Mode::SideBand64k);
    if (as_text(std::span(out).first(4)) != "fff0") { std::cerr << "64k first packet length\n"; return 1; }
    // 65515 + 65515 + 18970
    if (out.size() != 3 * 5 + 150000) { std::cerr << "64k total size " << out.size() << "\n"; return 1; }
    const auto dm = sideband::demultiplex(out);
    if (!dm || dm.value().pack_data != data) { std::cerr << "64k demux\n"; return 1; }
  }

  // plain side-band: 1000-byte packets
  {
    const std::vector<std::uint8_t> data(2000, 0x11);
    std::vector<std::uint8_t> out;
    sideband::append_chunked(out, sideband::Channel::PackData, data, sideband::Mode::SideBand);
    if (as_text(std::span(out).first(4)) != "03e8") { std::cerr << "plain packet length\n"; return 1; }
    if (out.size() != 3 * 5 + 2000) { std::cerr << "plain total size\n"; return 1; }
    const auto dm = sideband::demultiplex(out);
    if (!dm || dm.value().pack_data.size() != 2000) { std::cerr << "plain demux\n"; return 1; }
  }

  // mixed channels stop at the flush
  {
    std::vector<std::uint8_t> stream;
    append(stream, sideband::wrap(sideband::Channel::Progress, "Enumerating objects: 2, done.\n"));
    append(stream, sideband::wrap(sideband::Channel::PackData, "PACK"));
    append(stream, sideband::wrap(sideband::Channel::Error, "upload-pack: boom\n"));
    pktline::append_flush(stream);
    append(stream, "trailing");
    const auto dm = sideband::demultiplex(stream);
    if (!dm) { std::cerr << "mixed demux: " << dm.status().message << "\n"; return 1; }
    if (as_text(dm.value().pack_data) != "PACK" || dm.value().progress.size() != 1 ||
        dm.value().errors != std::vector<std::string>{"upload-pack: boom\n"}) {
      std::cerr << "mixed channels\n"; return 1;
    }
  }

  // malformed streams
  {
    const auto unknown = sideband::demultiplex(as_bytes("0006\x05x"));
    if (unknown || unknown.kind() != ErrorKind::ProtocolFraming) { std::cerr << "channel 5 accepted\n"; return 1; }
    const auto empty = sideband::demultiplex(as_bytes("0004"));
    if (empty || empty.kind() != ErrorKind::ProtocolFraming) { std::cerr << "empty payload accepted\n"; return 1; }
    const auto cut = sideband::demultiplex(as_bytes("000a\x01" "abc"));
    if (cut || cut.kind() != ErrorKind::ProtocolFraming) { std::cerr << "truncated packet accepted\n"; return 1; }
  }

  // Mux in each mode
  {
    std::vector<std::uint8_t> sink;
    sideband::Mux mux(sideband::Mode::SideBand64k,
                      [&](std::span<const std::uint8_t> b) { append(sink, b); });
    mux.progress("Total 1\n");
    mux.pack_data(as_bytes("PACKDATA"));
    mux.error("upload-pack: stopped\n");
    mux.flush();
    if (mux.bytes_written() != sink.size()) { std::cerr << "bytes_written\n"; return 1; }
    const auto dm = sideband::demultiplex(sink);
    if (!dm || as_text(dm.value().pack_data) != "PACKDATA" ||
        dm.value().progress != std::vector<std::string>{"Total 1\n"} || dm.value().errors.size() != 1) {
      std::cerr << "mux 64k\n"; return 1;
    }
    if (as_text(std::span(sink).last(4)) != "0000") { std::cerr << "mux flush\n"; return 1; }

    std::vector<std::uint8_t> raw;
    sideband::Mux plain(sideband::Mode::None, [&](std::span<const std::uint8_t> b) { append(raw, b); });
    plain.progress("dropped\n");
    plain.pack_data(as_bytes("PACKDATA"));
    plain.error("dropped too\n");
    plain.flush();
    if (as_text(raw) != "PACKDATA") { std::cerr << "mux without side-band: " << as_text(raw) << "\n"; return 1; }
  }

  std::cout << "sideband OK\n";
  return 0;
}
