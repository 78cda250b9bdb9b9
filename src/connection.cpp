#include "gitwire/connection.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <system_error>
#include <unistd.h>

namespace gitwire {

auto UniqueFd::operator=(UniqueFd &&other) noexcept -> UniqueFd & {
  if (this != &other) {
    close_if_open();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void UniqueFd::reset(int fd) noexcept {
  if (fd_ != fd) {
    close_if_open();
    fd_ = fd;
  }
}

void UniqueFd::close_if_open() noexcept {
  if (fd_ != -1) {
    // best effort; no throw in destructor
    ::close(fd_);
    fd_ = -1;
  }
}

std::size_t FdConnection::read_some(std::span<std::uint8_t> out) {
  while (true) {
    const ssize_t r = ::read(in_, out.data(), out.size());
    if (r >= 0)
      return static_cast<std::size_t>(r);
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "read");
  }
}

void FdConnection::write_all(std::span<const std::uint8_t> bytes) {
  const auto *p = bytes.data();
  std::size_t n = bytes.size();
  while (n != 0U) {
    const ssize_t w = ::write(out_, p, n);
    if (w < 0 && errno == EINTR)
      continue;
    if (w <= 0) {
      throw std::system_error(errno, std::generic_category(), "write");
    }
    p += static_cast<std::size_t>(w);
    n -= static_cast<std::size_t>(w);
  }
}

std::size_t MemoryConnection::read_some(std::span<std::uint8_t> out) {
  const std::size_t n = std::min({out.size(), chunk_, input_.size() - pos_});
  std::copy_n(input_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
  pos_ += n;
  return n;
}

void MemoryConnection::write_all(std::span<const std::uint8_t> bytes) {
  output_.insert(output_.end(), bytes.begin(), bytes.end());
}

Result<std::optional<pktline::Packet>> PacketReader::next() {
  std::array<std::uint8_t, 8192> buf{};
  while (true) {
    auto pkt = reader_.next();
    if (!pkt || pkt.value())
      return pkt;
    if (eof_) {
      if (reader_.buffered() != 0)
        return Status::error(ErrorKind::ProtocolFraming, "connection closed inside a packet");
      return std::optional<pktline::Packet>{};
    }
    const std::size_t n = conn_.read_some(buf);
    if (n == 0)
      eof_ = true;
    else
      reader_.feed(std::span(buf.data(), n));
  }
}

Result<std::vector<pktline::Packet>> PacketReader::until_flush() {
  std::vector<pktline::Packet> out;
  while (true) {
    auto pkt = next();
    if (!pkt)
      return pkt.status();
    if (!pkt.value()) {
      if (!out.empty())
        return Status::error(ErrorKind::ProtocolFraming, "connection closed before flush");
      return out;
    }
    const bool flush = pkt.value()->type == pktline::PacketType::Flush;
    out.push_back(std::move(*pkt.value()));
    if (flush)
      return out;
  }
}

} // namespace gitwire
