#pragma once
#include "gitwire/error.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire::sideband {

enum class Channel : std::uint8_t { PackData = 1, Progress = 2, Error = 3 };

// What the client negotiated. None: pack bytes go out raw, progress is dropped.
enum class Mode : std::uint8_t { None, SideBand, SideBand64k };

// Data bytes per packet once the 4-byte length and channel byte are taken.
inline constexpr std::size_t kMaxData64k = 65515;
inline constexpr std::size_t kMaxDataPlain = 995;

[[nodiscard]] auto max_data(Mode mode) -> std::size_t;

/**
 * One packet: channel byte followed by `bytes`. Throws Error(ProtocolFraming)
 * when it would not fit into a single pkt-line.
 */
std::vector<std::uint8_t> wrap(Channel channel, std::span<const std::uint8_t> bytes);
std::vector<std::uint8_t> wrap(Channel channel, std::string_view text);

// Split `bytes` over as many packets as `mode` requires and append them.
void append_chunked(std::vector<std::uint8_t> &out, Channel channel,
                    std::span<const std::uint8_t> bytes, Mode mode);

struct Demuxed {
  std::vector<std::uint8_t> pack_data; // channel 1, concatenated
  std::vector<std::string> progress;   // channel 2, one entry per packet
  std::vector<std::string> errors;     // channel 3
};

/**
 * Split a multiplexed stream up to its flush packet (or the end of input).
 * Fails with ProtocolFraming on a bad packet, an empty payload, an unknown
 * channel or a truncated tail.
 */
Result<Demuxed> demultiplex(std::span<const std::uint8_t> stream);

/**
 * Writes one response through the negotiated side-band. The sink receives
 * each encoded packet as soon as it is produced.
 */
class Mux {
public:
  using Sink = std::function<void(std::span<const std::uint8_t>)>;

  Mux(Mode mode, Sink sink) : mode_(mode), sink_(std::move(sink)) {}

  void pack_data(std::span<const std::uint8_t> bytes);
  void progress(std::string_view text);
  // Fatal message on channel 3 (or nothing in Mode::None).
  void error(std::string_view text);
  void flush();

  [[nodiscard]] auto mode() const -> Mode { return mode_; }
  [[nodiscard]] auto bytes_written() const -> std::uint64_t { return written_; }

private:
  void emit(std::span<const std::uint8_t> bytes);

  Mode mode_;
  Sink sink_;
  std::uint64_t written_ = 0;
};

} // namespace gitwire::sideband
