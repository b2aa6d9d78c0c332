#pragma once

#include "wiredrive/common/json_util.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wiredrive::protocol {

/// Capability name to raw JSON value. The server's answer is authoritative.
using Capabilities = common::JsonFields;

struct BuildInfo {
  std::string version;
  std::string revision;
  std::string time;
};

struct OsInfo {
  std::string arch;
  std::string name;
  std::string version;
};

struct ServerStatus {
  BuildInfo build;
  OsInfo os;
};

struct Size {
  int width = 0;
  int height = 0;
};

struct Position {
  int x = 0;
  int y = 0;
};

struct Cookie {
  std::string name;
  std::string value;
  std::string path;
  std::string domain;
  bool secure = false;
  std::optional<std::int64_t> expiry;
};

enum class LocatorStrategy {
  ClassName,
  CssSelector,
  Id,
  Name,
  LinkText,
  PartialLinkText,
  TagName,
  XPath,
};

/// Wire name of a strategy ("css selector", "xpath", ...).
[[nodiscard]] std::string_view locator_strategy_name(LocatorStrategy strategy);

inline constexpr const char *kTimeoutScript = "script";
inline constexpr const char *kTimeoutImplicit = "implicit";
inline constexpr const char *kTimeoutPageLoad = "page load";

} // namespace wiredrive::protocol
