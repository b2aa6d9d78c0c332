#include "wiredrive/protocol/command_error.hpp"

#include <array>

namespace wiredrive::protocol {

namespace {

struct StatusCodeEntry {
  int code;
  std::string_view name;
  std::string_view description;
};

constexpr std::array<StatusCodeEntry, 25> kStatusCodes{{
    {0, "success", "The command executed successfully."},
    {6, "no such driver", "A session is either terminated or not started."},
    {7, "no such element",
     "An element could not be located on the page using the given search parameters."},
    {8, "no such frame",
     "A request to switch to a frame could not be satisfied because the frame could not be "
     "found."},
    {9, "unknown command",
     "The requested resource could not be found, or a request was received using an HTTP "
     "method that is not supported by the mapped resource."},
    {10, "stale element reference",
     "An element command failed because the referenced element is no longer attached to the "
     "DOM."},
    {11, "element not visible",
     "An element command could not be completed because the element is not visible on the "
     "page."},
    {12, "invalid element state",
     "An element command could not be completed because the element is in an invalid state "
     "(e.g. attempting to click a disabled element)."},
    {13, "unknown error", "An unknown server-side error occurred while processing the command."},
    {15, "element is not selectable",
     "An attempt was made to select an element that cannot be selected."},
    {17, "javascript error", "An error occurred while executing user supplied JavaScript."},
    {19, "xpath lookup error", "An error occurred while searching for an element by XPath."},
    {21, "timeout", "An operation did not complete before its timeout expired."},
    {23, "no such window",
     "A request to switch to a different window could not be satisfied because the window "
     "could not be found."},
    {24, "invalid cookie domain",
     "An illegal attempt was made to set a cookie under a different domain than the current "
     "page."},
    {25, "unable to set cookie", "A request to set a cookie's value could not be satisfied."},
    {26, "unexpected alert open", "A modal dialog was open, blocking this operation."},
    {27, "no alert open",
     "An attempt was made to operate on a modal dialog when one was not open."},
    {28, "script timeout", "A script did not complete before its timeout expired."},
    {29, "invalid element coordinates",
     "The coordinates provided to an interactions operation are invalid."},
    {30, "ime not available", "IME was not available."},
    {31, "ime engine activation failed", "An IME engine could not be started."},
    {32, "invalid selector", "Argument was an invalid selector (e.g. XPath/CSS)."},
    {33, "session not created", "A new session could not be created."},
    {34, "move target out of bounds", "Target provided for a move action is out of bounds."},
}};

const StatusCodeEntry *find_entry(const int code) {
  for (const auto &entry : kStatusCodes) {
    if (entry.code == code) {
      return &entry;
    }
  }
  return nullptr;
}

} // namespace

std::string_view status_code_name(const int code) {
  const auto *entry = find_entry(code);
  return entry == nullptr ? std::string_view{} : entry->name;
}

std::string_view status_code_description(const int code) {
  const auto *entry = find_entry(code);
  return entry == nullptr ? std::string_view{} : entry->description;
}

bool is_known_status_code(const int code) { return find_entry(code) != nullptr; }

std::string CommandError::to_string() const {
  std::string out = error_type;
  if (!out.empty()) {
    out += ": ";
  }
  if (status_code == kStatusNotSpecified) {
    out += "status code not specified";
    return out;
  }
  if (const auto *entry = find_entry(status_code); entry != nullptr) {
    out += std::string(entry->description) + ": " + message;
    return out;
  }
  out += "unknown status code (" + std::to_string(status_code) + "): " + message;
  return out;
}

} // namespace wiredrive::protocol
