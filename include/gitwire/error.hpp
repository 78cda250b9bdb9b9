#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace gitwire {

/*
  Error taxonomy shared by every module.

  Parsers report these through Status/Result because malformed or partial
  input is routine on a network connection. Error (the exception) is reserved
  for caller bugs and broken internal invariants.
*/
enum class ErrorKind : std::uint8_t {
  None = 0,

  ProtocolFraming,    // malformed pkt-line, bad hex, oversize packet
  CapabilityError,    // malformed capability token
  NegotiationError,   // malformed want/have line, invalid ACK status
  ObjectNotFound,     // want or object data missing from the store
  DeltaError,         // size mismatch, out-of-bounds copy, bad opcode
  PackIntegrityError, // bad pack header, checksum or object stream
  Cancelled,          // stop requested by the caller
  Io                  // transport read/write failure
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &msg)
      : std::runtime_error(std::string(to_string(kind)) + ": " + msg), kind_(kind) {}

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

private:
  ErrorKind kind_;
};

struct Status {
  ErrorKind   kind = ErrorKind::None;
  std::string message;

  static Status ok() { return {}; }

  static Status error(ErrorKind k, std::string msg) { return {k, std::move(msg)}; }

  explicit operator bool() const { return kind == ErrorKind::None; }

  [[nodiscard]] auto to_error() const -> Error { return Error{kind, message}; }
};

// Value or Status. An ok Status is never stored as an error.
template <typename T> class Result {
public:
  Result(T value) : value_(std::move(value)) {}
  Result(Status status) : status_(std::move(status)) {
    if (status_.kind == ErrorKind::None) {
      throw std::logic_error("Result built from an ok Status");
    }
  }

  [[nodiscard]] auto ok() const -> bool { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  [[nodiscard]] auto value() & -> T & { return *value_; }
  [[nodiscard]] auto value() const & -> const T & { return *value_; }
  [[nodiscard]] auto value() && -> T && { return std::move(*value_); }

  [[nodiscard]] auto status() const -> const Status & { return status_; }
  [[nodiscard]] auto kind() const -> ErrorKind { return status_.kind; }

private:
  std::optional<T> value_;
  Status status_;
};

} // namespace gitwire
