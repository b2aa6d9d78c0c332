#include "wiredrive/common/result.hpp"

namespace wiredrive::common {

std::string error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::State:
    return "state";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::Config:
    return "config";
  case ErrorKind::Protocol:
    return "protocol";
  case ErrorKind::Command:
    return "command";
  case ErrorKind::Io:
    break;
  }
  return "io";
}

Error Error::with_prefix(const std::string &prefix) const {
  Error out = *this;
  out.message = prefix + out.message;
  return out;
}

std::string Error::to_string() const {
  return "[" + error_kind_to_string(kind) + "] " + message;
}

Error state_error(std::string message) {
  return Error{.kind = ErrorKind::State, .message = std::move(message)};
}

Error timeout_error(std::string message) {
  return Error{.kind = ErrorKind::Timeout, .message = std::move(message)};
}

Error config_error(std::string message) {
  return Error{.kind = ErrorKind::Config, .message = std::move(message)};
}

Error protocol_error(std::string message) {
  return Error{.kind = ErrorKind::Protocol, .message = std::move(message)};
}

Error io_error(std::string message) {
  return Error{.kind = ErrorKind::Io, .message = std::move(message)};
}

} // namespace wiredrive::common
