#include "gitwire/pkt_line.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/util.hpp"

#include <array>
#include <string>

namespace gitwire::pktline {

namespace {

int hexval(std::uint8_t c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  return -1;
}

void append_header(std::vector<std::uint8_t> &out, std::size_t total) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  out.push_back(static_cast<std::uint8_t>(kHex[(total >> 12) & 0xF]));
  out.push_back(static_cast<std::uint8_t>(kHex[(total >> 8) & 0xF]));
  out.push_back(static_cast<std::uint8_t>(kHex[(total >> 4) & 0xF]));
  out.push_back(static_cast<std::uint8_t>(kHex[total & 0xF]));
}

} // namespace

void append_data(std::vector<std::uint8_t> &out, std::span<const std::uint8_t> payload) {
  const std::size_t total = payload.size() + consts::kPktHeaderLen;
  if (total > consts::kPktMaxLen) {
    throw Error(ErrorKind::ProtocolFraming,
                "packet of " + std::to_string(total) + " bytes exceeds " +
                    std::to_string(consts::kPktMaxLen));
  }
  out.reserve(out.size() + total);
  append_header(out, total);
  out.insert(out.end(), payload.begin(), payload.end());
}

void append_data(std::vector<std::uint8_t> &out, std::string_view payload) {
  append_data(out, as_bytes(payload));
}

void append_flush(std::vector<std::uint8_t> &out) { append(out, kFlush); }
void append_delimiter(std::vector<std::uint8_t> &out) { append(out, kDelimiter); }
void append_response_end(std::vector<std::uint8_t> &out) { append(out, kResponseEnd); }

std::vector<std::uint8_t> encode(std::span<const std::uint8_t> payload) {
  std::vector<std::uint8_t> out;
  append_data(out, payload);
  return out;
}

std::vector<std::uint8_t> encode(std::string_view payload) { return encode(as_bytes(payload)); }

Result<Decoded> decode(std::span<const std::uint8_t> buffer) {
  if (buffer.size() < consts::kPktHeaderLen) {
    return Decoded{};
  }
  std::size_t len = 0;
  for (std::size_t i = 0; i < consts::kPktHeaderLen; ++i) {
    const int v = hexval(buffer[i]);
    if (v < 0) {
      return Status::error(ErrorKind::ProtocolFraming,
                           "invalid pkt-line length '" +
                               std::string(as_text(buffer.first(consts::kPktHeaderLen))) + "'");
    }
    len = (len << 4) | static_cast<std::size_t>(v);
  }

  switch (len) {
  case 0:
    return Decoded{Packet::flush(), consts::kPktHeaderLen};
  case 1:
    return Decoded{Packet::delimiter(), consts::kPktHeaderLen};
  case 2:
    return Decoded{Packet::response_end(), consts::kPktHeaderLen};
  case 3:
    return Status::error(ErrorKind::ProtocolFraming, "reserved pkt-line length 0003");
  default:
    break;
  }
  if (len > consts::kPktMaxLen) {
    return Status::error(ErrorKind::ProtocolFraming,
                         "pkt-line length " + std::to_string(len) + " exceeds " +
                             std::to_string(consts::kPktMaxLen));
  }
  if (buffer.size() < len) {
    return Decoded{};
  }
  return Decoded{Packet::data(buffer.subspan(consts::kPktHeaderLen, len - consts::kPktHeaderLen)),
                 len};
}

Result<StreamDecoded> decode_stream(std::span<const std::uint8_t> buffer) {
  StreamDecoded out;
  std::size_t off = 0;
  while (off < buffer.size()) {
    auto res = decode(buffer.subspan(off));
    if (!res) {
      return res.status();
    }
    if (res.value().incomplete()) {
      break;
    }
    off += res.value().consumed;
    out.packets.push_back(std::move(*res.value().packet));
  }
  out.remaining.assign(buffer.begin() + static_cast<std::ptrdiff_t>(off), buffer.end());
  return out;
}

void Reader::feed(std::span<const std::uint8_t> bytes) {
  // compact once the consumed prefix dominates
  if (pos_ > 0 && pos_ * 2 >= buf_.size()) {
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(pos_));
    pos_ = 0;
  }
  buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

Result<std::optional<Packet>> Reader::next() {
  if (!failed_) {
    return failed_;
  }
  auto res = decode(std::span<const std::uint8_t>(buf_).subspan(pos_));
  if (!res) {
    failed_ = res.status();
    return failed_;
  }
  if (res.value().incomplete()) {
    return std::optional<Packet>{};
  }
  pos_ += res.value().consumed;
  return std::move(res.value().packet);
}

} // namespace gitwire::pktline
