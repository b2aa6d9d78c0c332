#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace wiredrive::config {

/// A preference as read from configuration. Only bool, integer and string
/// can be written to a profile; the other alternatives exist because TOML
/// can express them.
using PreferenceValue =
    std::variant<bool, std::int64_t, std::string, double, std::vector<std::string>>;
using Preferences = std::map<std::string, PreferenceValue>;

inline constexpr std::uint16_t kStandaloneBasePort = 9515;
inline constexpr std::uint16_t kExtensionBasePort = 7055;

/// A driver binary that speaks the protocol itself (chromedriver style).
struct StandaloneDriver {
  std::string log_path = "chromedriver.log";
  std::uint32_t http_threads = 4;
  std::string url_base;
};

/// A browser started on a throwaway profile carrying the automation extension.
struct ExtensionDriver {
  std::string extension_archive;
  std::string log_dir;
  Preferences preferences;
  bool delete_profile_on_stop = true;
};

using DriverKind = std::variant<StandaloneDriver, ExtensionDriver>;

struct DriverConfig {
  DriverKind kind = StandaloneDriver{};
  std::string binary;
  std::uint16_t port = 0;
  std::chrono::milliseconds lock_timeout{60'000};
  std::chrono::milliseconds start_timeout{20'000};
  std::chrono::milliseconds probe_interval{1'000};
  std::chrono::milliseconds lock_retry_interval{1'000};
  std::chrono::milliseconds stop_grace{2'000};
  std::chrono::milliseconds pump_join_timeout{2'000};
  std::chrono::milliseconds request_timeout{300'000};
  std::string log_file;
  std::map<std::string, std::string> env;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  DriverConfig driver;
  ObservabilityConfig observability;
};

[[nodiscard]] std::string driver_kind_name(const DriverKind &kind);
[[nodiscard]] std::uint16_t default_base_port(const DriverKind &kind);
[[nodiscard]] std::string preference_type_name(const PreferenceValue &value);

} // namespace wiredrive::config
