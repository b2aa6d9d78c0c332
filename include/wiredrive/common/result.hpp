#pragma once

#include "wiredrive/protocol/command_error.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace wiredrive::common {

enum class ErrorKind {
  State,
  Timeout,
  Config,
  Protocol,
  Command,
  Io,
};

[[nodiscard]] std::string error_kind_to_string(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::Io;
  std::string message;
  std::optional<protocol::CommandError> command;

  /// Same error with `prefix` prepended to the message.
  [[nodiscard]] Error with_prefix(const std::string &prefix) const;
  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] Error state_error(std::string message);
[[nodiscard]] Error timeout_error(std::string message);
[[nodiscard]] Error config_error(std::string message);
[[nodiscard]] Error protocol_error(std::string message);
[[nodiscard]] Error io_error(std::string message);

class Status {
public:
  static Status success() { return Status(std::nullopt); }
  static Status error(Error error) { return Status(std::move(error)); }
  static Status error(ErrorKind kind, std::string message) {
    return Status(Error{.kind = kind, .message = std::move(message)});
  }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }

  [[nodiscard]] const Error &error() const {
    if (!error_.has_value()) {
      throw std::logic_error("Status has no error");
    }
    return *error_;
  }

private:
  explicit Status(std::optional<Error> error) : error_(std::move(error)) {}

  std::optional<Error> error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(Error error) { return Result(std::nullopt, std::move(error)); }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(std::nullopt, Error{.kind = kind, .message = std::move(message)});
  }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] const Error &error() const {
    if (ok()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

private:
  Result(std::optional<T> value, std::optional<Error> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<Error> error_;
};

} // namespace wiredrive::common
