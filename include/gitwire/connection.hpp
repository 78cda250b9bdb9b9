#pragma once
#include "gitwire/error.hpp"
#include "gitwire/pkt_line.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace gitwire {

/**
 * Byte stream to one client. read_some returns 0 at end of stream; both
 * calls throw std::system_error when the transport fails.
 */
class Connection {
public:
  virtual ~Connection() = default;

  virtual std::size_t read_some(std::span<std::uint8_t> out) = 0;
  virtual void write_all(std::span<const std::uint8_t> bytes) = 0;
};

// Owning file descriptor.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd &;

  ~UniqueFd() { close_if_open(); }

  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ != -1; }
  [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset(int fd = -1) noexcept;

private:
  int fd_{-1};

  void close_if_open() noexcept;
};

// Pipes (stdin/stdout) or a socket. Descriptors are borrowed.
class FdConnection : public Connection {
public:
  FdConnection(int in_fd, int out_fd) noexcept : in_(in_fd), out_(out_fd) {}

  std::size_t read_some(std::span<std::uint8_t> out) override;
  void write_all(std::span<const std::uint8_t> bytes) override;

private:
  int in_;
  int out_;
};

// Canned input, captured output. `chunk` limits each read to exercise
// partial-packet handling.
class MemoryConnection : public Connection {
public:
  explicit MemoryConnection(std::vector<std::uint8_t> input, std::size_t chunk = 4096)
      : input_(std::move(input)), chunk_(chunk == 0 ? 1 : chunk) {}

  std::size_t read_some(std::span<std::uint8_t> out) override;
  void write_all(std::span<const std::uint8_t> bytes) override;

  [[nodiscard]] auto output() const -> const std::vector<std::uint8_t> & { return output_; }

private:
  std::vector<std::uint8_t> input_;
  std::size_t pos_ = 0;
  std::size_t chunk_;
  std::vector<std::uint8_t> output_;
};

/**
 * Pulls whole pkt-lines off a Connection. nullopt means the peer closed the
 * stream between packets; closing inside a packet is a ProtocolFraming
 * error.
 */
class PacketReader {
public:
  explicit PacketReader(Connection &conn) : conn_(conn) {}

  Result<std::optional<pktline::Packet>> next();

  // Packets up to and including the next flush; an empty vector at end of stream.
  Result<std::vector<pktline::Packet>> until_flush();

private:
  Connection &conn_;
  pktline::Reader reader_;
  bool eof_ = false;
};

} // namespace gitwire
