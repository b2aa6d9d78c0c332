#pragma once

#include "wiredrive/common/result.hpp"
#include "wiredrive/protocol/command_error.hpp"

#include <string>

namespace wiredrive::protocol {

/// Decoded `{sessionId, status, value}` response body. `value` stays raw JSON.
struct Envelope {
  std::string session_id;
  int status = kStatusSuccess;
  std::string value = "null";
};

/// Fails with a protocol error when `body` is not a JSON object or its members have the
/// wrong types.
[[nodiscard]] common::Result<Envelope> decode_envelope(const std::string &body);

/// "400: Missing Command Parameters" and friends; empty for 200.
[[nodiscard]] std::string http_status_category(long http_status);

[[nodiscard]] CommandError classify(long http_status, const Envelope &envelope);

/// Timeout for codes 21 and 28, Command otherwise. The CommandError rides along.
[[nodiscard]] common::Error to_error(CommandError command);

} // namespace wiredrive::protocol
