#pragma once
#include "gitwire/error.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire::pktline {

enum class PacketType : std::uint8_t { Data, Flush, Delimiter, ResponseEnd };

struct Packet {
  PacketType type = PacketType::Data;
  std::vector<std::uint8_t> payload; // empty for the three markers

  static Packet data(std::span<const std::uint8_t> bytes) {
    return Packet{PacketType::Data, {bytes.begin(), bytes.end()}};
  }
  static Packet flush() { return Packet{PacketType::Flush, {}}; }
  static Packet delimiter() { return Packet{PacketType::Delimiter, {}}; }
  static Packet response_end() { return Packet{PacketType::ResponseEnd, {}}; }

  [[nodiscard]] auto is_data() const -> bool { return type == PacketType::Data; }
  // Payload viewed as text (protocol lines)
  [[nodiscard]] auto text() const -> std::string_view {
    return {reinterpret_cast<const char *>(payload.data()), payload.size()};
  }

  friend bool operator==(const Packet &, const Packet &) = default;
};

// Marker packets on the wire
inline constexpr std::string_view kFlush       = "0000";
inline constexpr std::string_view kDelimiter   = "0001";
inline constexpr std::string_view kResponseEnd = "0002";

/**
 * Frame one payload: 4 lowercase hex digits (payload length + 4) then the
 * payload. Throws Error(ProtocolFraming) when the packet would exceed 65520
 * bytes; use the side-band chunking helpers for bulk data.
 */
std::vector<std::uint8_t> encode(std::span<const std::uint8_t> payload);
std::vector<std::uint8_t> encode(std::string_view payload);

// Appending forms used when building a response in place.
void append_data(std::vector<std::uint8_t> &out, std::span<const std::uint8_t> payload);
void append_data(std::vector<std::uint8_t> &out, std::string_view payload);
void append_flush(std::vector<std::uint8_t> &out);
void append_delimiter(std::vector<std::uint8_t> &out);
void append_response_end(std::vector<std::uint8_t> &out);

struct Decoded {
  std::optional<Packet> packet; // nullopt: incomplete, buffer more bytes
  std::size_t consumed = 0;

  [[nodiscard]] auto incomplete() const -> bool { return !packet.has_value(); }
};

/**
 * Decode the packet at the front of `buffer`.
 * Incomplete input (short header or short payload) is not an error: the
 * result has no packet and consumes 0 bytes. Invalid hex, the reserved 0003
 * length and lengths above 65520 fail with ProtocolFraming.
 */
Result<Decoded> decode(std::span<const std::uint8_t> buffer);

struct StreamDecoded {
  std::vector<Packet> packets;
  std::vector<std::uint8_t> remaining; // tail of an incomplete packet
};

// Decode packets until the buffer runs dry or a packet is incomplete.
Result<StreamDecoded> decode_stream(std::span<const std::uint8_t> buffer);

/**
 * Accumulates partial reads from a connection and hands out whole packets.
 * Bytes after a framing error are not examined again; the reader stays
 * failed.
 */
class Reader {
public:
  // Append bytes read from the transport.
  void feed(std::span<const std::uint8_t> bytes);

  // Next complete packet, nullopt when more bytes are needed.
  Result<std::optional<Packet>> next();

  [[nodiscard]] auto buffered() const -> std::size_t { return buf_.size() - pos_; }

private:
  std::vector<std::uint8_t> buf_;
  std::size_t pos_ = 0;
  Status failed_;
};

} // namespace gitwire::pktline
