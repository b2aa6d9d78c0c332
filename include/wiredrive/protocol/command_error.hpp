#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wiredrive::protocol {

// JSON Wire Protocol status codes.
inline constexpr int kStatusSuccess = 0;
inline constexpr int kStatusNoSuchDriver = 6;
inline constexpr int kStatusNoSuchElement = 7;
inline constexpr int kStatusNoSuchFrame = 8;
inline constexpr int kStatusUnknownCommand = 9;
inline constexpr int kStatusStaleElementReference = 10;
inline constexpr int kStatusElementNotVisible = 11;
inline constexpr int kStatusInvalidElementState = 12;
inline constexpr int kStatusUnknownError = 13;
inline constexpr int kStatusElementIsNotSelectable = 15;
inline constexpr int kStatusJavaScriptError = 17;
inline constexpr int kStatusXPathLookupError = 19;
inline constexpr int kStatusTimeout = 21;
inline constexpr int kStatusNoSuchWindow = 23;
inline constexpr int kStatusInvalidCookieDomain = 24;
inline constexpr int kStatusUnableToSetCookie = 25;
inline constexpr int kStatusUnexpectedAlertOpen = 26;
inline constexpr int kStatusNoAlertOpen = 27;
inline constexpr int kStatusScriptTimeout = 28;
inline constexpr int kStatusInvalidElementCoordinates = 29;
inline constexpr int kStatusImeNotAvailable = 30;
inline constexpr int kStatusImeEngineActivationFailed = 31;
inline constexpr int kStatusInvalidSelector = 32;
inline constexpr int kStatusSessionNotCreated = 33;
inline constexpr int kStatusMoveTargetOutOfBounds = 34;

// Used when the HTTP layer failed and the envelope carried no status.
inline constexpr int kStatusNotSpecified = -1;

struct StackFrame {
  std::string file_name;
  std::string class_name;
  std::string method_name;
  int line_number = 0;
};

struct CommandError {
  int status_code = kStatusNotSpecified;
  std::string error_type;
  std::string message;
  std::string screen;
  std::string class_name;
  std::vector<StackFrame> stack_trace;

  [[nodiscard]] std::string to_string() const;
};

/// Short protocol name for a status code ("no such element"), empty when unknown.
[[nodiscard]] std::string_view status_code_name(int code);

/// Long description for a status code, empty when unknown.
[[nodiscard]] std::string_view status_code_description(int code);

[[nodiscard]] bool is_known_status_code(int code);

} // namespace wiredrive::protocol
