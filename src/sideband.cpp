#include "gitwire/sideband.hpp"

#include "gitwire/pkt_line.hpp"
#include "gitwire/util.hpp"

#include <algorithm>

namespace gitwire::sideband {

std::size_t max_data(Mode mode) {
  return mode == Mode::SideBand64k ? kMaxData64k : kMaxDataPlain;
}

std::vector<std::uint8_t> wrap(Channel channel, std::span<const std::uint8_t> bytes) {
  std::vector<std::uint8_t> payload;
  payload.reserve(bytes.size() + 1);
  payload.push_back(static_cast<std::uint8_t>(channel));
  payload.insert(payload.end(), bytes.begin(), bytes.end());
  return pktline::encode(payload);
}

std::vector<std::uint8_t> wrap(Channel channel, std::string_view text) {
  return wrap(channel, as_bytes(text));
}

void append_chunked(std::vector<std::uint8_t> &out, Channel channel,
                    std::span<const std::uint8_t> bytes, Mode mode) {
  const std::size_t chunk = max_data(mode);
  std::vector<std::uint8_t> payload;
  for (std::size_t pos = 0; pos < bytes.size(); pos += chunk) {
    const auto part = bytes.subspan(pos, std::min(chunk, bytes.size() - pos));
    payload.assign(1, static_cast<std::uint8_t>(channel));
    payload.insert(payload.end(), part.begin(), part.end());
    pktline::append_data(out, payload);
  }
}

Result<Demuxed> demultiplex(std::span<const std::uint8_t> stream) {
  Demuxed out;
  std::size_t pos = 0;
  while (pos < stream.size()) {
    auto dec = pktline::decode(stream.subspan(pos));
    if (!dec)
      return dec.status();
    if (dec.value().incomplete()) {
      return Status::error(ErrorKind::ProtocolFraming, "side-band stream ends inside a packet");
    }
    pos += dec.value().consumed;
    const auto &pkt = *dec.value().packet;
    if (pkt.type == pktline::PacketType::Flush)
      break;
    if (!pkt.is_data() || pkt.payload.empty()) {
      return Status::error(ErrorKind::ProtocolFraming, "side-band packet without a channel");
    }

    const auto body = std::span(pkt.payload).subspan(1);
    switch (pkt.payload[0]) {
    case static_cast<std::uint8_t>(Channel::PackData):
      out.pack_data.insert(out.pack_data.end(), body.begin(), body.end());
      break;
    case static_cast<std::uint8_t>(Channel::Progress):
      out.progress.emplace_back(as_text(body));
      break;
    case static_cast<std::uint8_t>(Channel::Error):
      out.errors.emplace_back(as_text(body));
      break;
    default:
      return Status::error(ErrorKind::ProtocolFraming,
                           "unknown side-band channel " + std::to_string(pkt.payload[0]));
    }
  }
  return out;
}

void Mux::emit(std::span<const std::uint8_t> bytes) {
  if (bytes.empty())
    return;
  written_ += bytes.size();
  sink_(bytes);
}

void Mux::pack_data(std::span<const std::uint8_t> bytes) {
  if (mode_ == Mode::None) {
    emit(bytes);
    return;
  }
  std::vector<std::uint8_t> out;
  append_chunked(out, Channel::PackData, bytes, mode_);
  emit(out);
}

void Mux::progress(std::string_view text) {
  if (mode_ == Mode::None)
    return;
  std::vector<std::uint8_t> out;
  append_chunked(out, Channel::Progress, as_bytes(text), mode_);
  emit(out);
}

void Mux::error(std::string_view text) {
  if (mode_ == Mode::None)
    return;
  // the client prints it as-is; keep it to one packet
  const auto msg = text.substr(0, max_data(mode_));
  emit(wrap(Channel::Error, msg));
}

void Mux::flush() {
  if (mode_ == Mode::None)
    return; // a raw pack simply ends
  std::vector<std::uint8_t> out;
  pktline::append_flush(out);
  emit(out);
}

} // namespace gitwire::sideband
