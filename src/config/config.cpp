#include "wiredrive/config/config.hpp"

#include "wiredrive/common/fs.hpp"
#include "wiredrive/common/toml.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>

namespace wiredrive::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".wiredrive";
constexpr const char *CONFIG_FILENAME = "config.toml";

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::optional<std::uint16_t> parse_port(const std::string &text) {
  const std::string normalized = common::trim(text);
  unsigned int parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (normalized.empty() || ec != std::errc() || ptr != last || parsed > 65535) {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(parsed);
}

void load_duration(const common::TomlDocument &doc, const std::string &key,
                   std::chrono::milliseconds &target) {
  if (doc.has(key)) {
    target = std::chrono::milliseconds(
        doc.get_u64(key, static_cast<std::uint64_t>(target.count())));
  }
}

common::Status load_kind(DriverConfig &driver, const common::TomlDocument &doc) {
  const std::string kind = common::to_lower(doc.get_string("driver.kind", "standalone"));
  if (kind == "standalone") {
    StandaloneDriver standalone;
    standalone.log_path = expand_config_value(doc.get_string("driver.log_path", standalone.log_path));
    standalone.http_threads = static_cast<std::uint32_t>(
        doc.get_u64("driver.http_threads", standalone.http_threads));
    standalone.url_base = doc.get_string("driver.url_base", standalone.url_base);
    driver.kind = std::move(standalone);
    return common::Status::success();
  }

  if (kind == "extension") {
    ExtensionDriver extension;
    extension.extension_archive = expand_config_value(doc.get_string("driver.extension_archive"));
    extension.log_dir = expand_config_value(doc.get_string("driver.log_dir"));
    extension.delete_profile_on_stop =
        doc.get_bool("driver.delete_profile_on_stop", extension.delete_profile_on_stop);
    for (const auto &key : doc.keys_in_section("preferences")) {
      auto value = parse_preference_value(doc.get_raw("preferences." + key));
      if (!value.ok()) {
        return common::Status::error(value.error().with_prefix("preferences." + key + ": "));
      }
      extension.preferences[key] = value.value();
    }
    driver.kind = std::move(extension);
    return common::Status::success();
  }

  return common::Status::error(common::config_error("unknown driver.kind: " + kind));
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (const char *env = std::getenv("WIREDRIVE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(env)));
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

common::Result<PreferenceValue> parse_preference_value(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value == "true" || value == "false") {
    return common::Result<PreferenceValue>::success(PreferenceValue{value == "true"});
  }
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return common::Result<PreferenceValue>::success(
        PreferenceValue{common::unquote_toml_string(value)});
  }
  if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
    common::TomlDocument doc;
    doc.values["v"] = value;
    return common::Result<PreferenceValue>::success(PreferenceValue{doc.get_string_array("v")});
  }

  std::int64_t integer = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  if (auto [ptr, ec] = std::from_chars(first, last, integer);
      !value.empty() && ec == std::errc() && ptr == last) {
    return common::Result<PreferenceValue>::success(PreferenceValue{integer});
  }

  if (!value.empty()) {
    char *end = nullptr;
    errno = 0;
    const double floating = std::strtod(value.c_str(), &end);
    if (errno == 0 && end == value.c_str() + value.size()) {
      return common::Result<PreferenceValue>::success(PreferenceValue{floating});
    }
  }

  return common::Result<PreferenceValue>::failure(
      common::config_error("unsupported value: " + value));
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  DriverConfig &driver = config.driver;

  if (auto status = load_kind(driver, doc); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }

  driver.binary = expand_config_value(doc.get_string("driver.binary", driver.binary));
  if (doc.has("driver.port")) {
    const auto port = parse_port(doc.get_raw("driver.port"));
    if (!port.has_value()) {
      return common::Result<Config>::failure(
          common::config_error("driver.port must be 0-65535"));
    }
    driver.port = *port;
  }

  load_duration(doc, "driver.lock_timeout_ms", driver.lock_timeout);
  load_duration(doc, "driver.start_timeout_ms", driver.start_timeout);
  load_duration(doc, "driver.probe_interval_ms", driver.probe_interval);
  load_duration(doc, "driver.lock_retry_interval_ms", driver.lock_retry_interval);
  load_duration(doc, "driver.stop_grace_ms", driver.stop_grace);
  load_duration(doc, "driver.pump_join_timeout_ms", driver.pump_join_timeout);
  load_duration(doc, "driver.request_timeout_ms", driver.request_timeout);

  driver.log_file = expand_config_value(doc.get_string("driver.log_file", driver.log_file));
  for (const auto &name : doc.keys_in_section("driver.env")) {
    driver.env[name] = doc.get_string("driver.env." + name);
  }

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(
        common::config_error("unable to open config file: " + path.string()));
  }
  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(config.error().with_prefix(path.string() + ": "));
  }
  return config;
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }

  Config config;
  std::error_code ec;
  if (std::filesystem::exists(path.value(), ec)) {
    auto loaded = load_config(path.value());
    if (!loaded.ok()) {
      return loaded;
    }
    config = loaded.value();
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const char *binary = std::getenv("WIREDRIVE_DRIVER_BINARY"); binary != nullptr && *binary) {
    config.driver.binary = binary;
  }

  if (const char *port = std::getenv("WIREDRIVE_DRIVER_PORT"); port != nullptr && *port) {
    if (const auto parsed = parse_port(port); parsed.has_value()) {
      config.driver.port = *parsed;
    }
  }

  if (const char *log_file = std::getenv("WIREDRIVE_LOG_FILE"); log_file != nullptr) {
    config.driver.log_file = log_file;
  }
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const DriverConfig &driver = config.driver;

  if (common::trim(driver.binary).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        common::config_error("driver.binary must be set"));
  }

  const std::pair<const char *, std::chrono::milliseconds> timeouts[] = {
      {"driver.lock_timeout_ms", driver.lock_timeout},
      {"driver.start_timeout_ms", driver.start_timeout},
      {"driver.probe_interval_ms", driver.probe_interval},
      {"driver.lock_retry_interval_ms", driver.lock_retry_interval},
      {"driver.request_timeout_ms", driver.request_timeout},
  };
  for (const auto &[key, value] : timeouts) {
    if (value.count() <= 0) {
      return common::Result<std::vector<std::string>>::failure(
          common::config_error(std::string(key) + " must be greater than zero"));
    }
  }

  if (driver.probe_interval > driver.start_timeout) {
    warnings.push_back("driver.probe_interval_ms exceeds driver.start_timeout_ms");
  }

  if (const auto *standalone = std::get_if<StandaloneDriver>(&driver.kind)) {
    if (standalone->http_threads == 0) {
      return common::Result<std::vector<std::string>>::failure(
          common::config_error("driver.http_threads must be greater than zero"));
    }
    if (!standalone->url_base.empty() && standalone->url_base.front() != '/') {
      warnings.push_back("driver.url_base should start with '/': " + standalone->url_base);
    }
  }

  if (const auto *extension = std::get_if<ExtensionDriver>(&driver.kind)) {
    if (common::trim(extension->extension_archive).empty()) {
      return common::Result<std::vector<std::string>>::failure(
          common::config_error("driver.extension_archive must be set for the extension kind"));
    }
    for (const auto &[key, value] : extension->preferences) {
      if (std::holds_alternative<double>(value) ||
          std::holds_alternative<std::vector<std::string>>(value)) {
        warnings.push_back("preferences." + key + " has unsupported type " +
                           preference_type_name(value) + " and will be rejected");
      }
    }
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend != "none" && backend != "noop" && backend != "log" &&
      backend.find(',') == std::string::npos) {
    warnings.push_back("unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace wiredrive::config
