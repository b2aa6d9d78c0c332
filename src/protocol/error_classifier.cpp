#include "wiredrive/protocol/error_classifier.hpp"

#include "wiredrive/common/json_util.hpp"

#include <limits>

namespace wiredrive::protocol {

namespace {

bool decode_string_member(const common::JsonFields &fields, const std::string &name,
                          std::string &out) {
  const auto raw = common::json_member(fields, name);
  if (!raw.has_value()) {
    return true;
  }
  auto decoded = common::json_decode_string(*raw);
  if (!decoded.has_value()) {
    return false;
  }
  out = std::move(*decoded);
  return true;
}

bool decode_frame(const std::string &raw, StackFrame &frame) {
  const auto fields = common::json_top_level_fields(raw);
  if (!fields.has_value()) {
    return false;
  }
  if (!decode_string_member(*fields, "filename", frame.file_name) ||
      !decode_string_member(*fields, "classname", frame.class_name) ||
      !decode_string_member(*fields, "methodname", frame.method_name)) {
    return false;
  }
  if (const auto line = common::json_member(*fields, "linenumber"); line.has_value()) {
    const auto number = common::json_decode_int(*line);
    if (!number.has_value() || *number < std::numeric_limits<int>::min() ||
        *number > std::numeric_limits<int>::max()) {
      return false;
    }
    frame.line_number = static_cast<int>(*number);
  }
  return true;
}

// Fills message, screen, class and stack trace from an object value. Leaves `error`
// untouched and returns false when the value does not have that shape.
bool decode_error_value(const std::string &value, CommandError &error) {
  if (common::json_is_null(value)) {
    return true;
  }
  const auto fields = common::json_top_level_fields(value);
  if (!fields.has_value()) {
    return false;
  }

  CommandError decoded = error;
  if (!decode_string_member(*fields, "message", decoded.message) ||
      !decode_string_member(*fields, "screen", decoded.screen) ||
      !decode_string_member(*fields, "class", decoded.class_name)) {
    return false;
  }

  if (const auto trace = common::json_member(*fields, "stacktrace"); trace.has_value()) {
    const auto frames = common::json_split_top_level_values(*trace);
    if (!frames.has_value()) {
      return false;
    }
    for (const auto &raw_frame : *frames) {
      StackFrame frame;
      if (!decode_frame(raw_frame, frame)) {
        return false;
      }
      decoded.stack_trace.push_back(std::move(frame));
    }
  }

  error = std::move(decoded);
  return true;
}

} // namespace

common::Result<Envelope> decode_envelope(const std::string &body) {
  const auto fields = common::json_top_level_fields(body);
  if (!fields.has_value()) {
    return common::Result<Envelope>::failure(
        common::protocol_error("response must be a JSON object"));
  }

  Envelope envelope;
  if (const auto it = fields->find("sessionId"); it != fields->end()) {
    if (const auto id = common::json_decode_string(it->second); id.has_value()) {
      envelope.session_id = *id;
    } else if (!common::json_is_null(it->second)) {
      return common::Result<Envelope>::failure(
          common::protocol_error("invalid sessionId in response: " + it->second));
    }
  }
  if (const auto it = fields->find("status"); it != fields->end() &&
                                              !common::json_is_null(it->second)) {
    const auto status = common::json_decode_int(it->second);
    if (!status.has_value() || *status < std::numeric_limits<int>::min() ||
        *status > std::numeric_limits<int>::max()) {
      return common::Result<Envelope>::failure(
          common::protocol_error("invalid status in response: " + it->second));
    }
    envelope.status = static_cast<int>(*status);
  }
  if (const auto it = fields->find("value"); it != fields->end()) {
    envelope.value = it->second;
  }
  return common::Result<Envelope>::success(std::move(envelope));
}

std::string http_status_category(const long http_status) {
  switch (http_status) {
  case 200:
    return "";
  case 400:
    return "400: Missing Command Parameters";
  case 404:
    return "404: Unknown command/Resource Not Found";
  case 405:
    return "405: Invalid Command Method";
  case 500:
    return "500: Failed Command";
  case 501:
    return "501: Unimplemented Command";
  default:
    return "unknown error";
  }
}

CommandError classify(const long http_status, const Envelope &envelope) {
  CommandError error;
  error.error_type = http_status_category(http_status);
  error.status_code = envelope.status == kStatusSuccess ? kStatusNotSpecified : envelope.status;
  if (!decode_error_value(envelope.value, error)) {
    error.message = envelope.value;
  }
  return error;
}

common::Error to_error(CommandError command) {
  const bool timed_out =
      command.status_code == kStatusTimeout || command.status_code == kStatusScriptTimeout;
  common::Error error{.kind = timed_out ? common::ErrorKind::Timeout : common::ErrorKind::Command,
                      .message = command.to_string()};
  error.command = std::move(command);
  return error;
}

} // namespace wiredrive::protocol
