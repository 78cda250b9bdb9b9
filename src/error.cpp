#include "gitwire/error.hpp"

namespace gitwire {

auto to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
  case ErrorKind::None:
    return "ok";
  case ErrorKind::ProtocolFraming:
    return "protocol framing error";
  case ErrorKind::CapabilityError:
    return "capability error";
  case ErrorKind::NegotiationError:
    return "negotiation error";
  case ErrorKind::ObjectNotFound:
    return "object not found";
  case ErrorKind::DeltaError:
    return "delta error";
  case ErrorKind::PackIntegrityError:
    return "pack integrity error";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::Io:
    return "i/o error";
  }
  return "unknown error";
}

} // namespace gitwire
