#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "wiredrive/config/config.hpp"

#include <variant>

void register_config_tests(std::vector<wiredrive::tests::TestCase> &tests) {
  using wiredrive::tests::require;
  using wiredrive::testing::EnvGuard;
  using wiredrive::testing::TempWorkspace;
  namespace cfg = wiredrive::config;

  tests.push_back({"config_path_prefers_env", [] {
                     const TempWorkspace workspace;
                     const EnvGuard env_path("WIREDRIVE_CONFIG_PATH",
                                             (workspace.path() / "custom.toml").string());
                     const auto path = cfg::config_path();
                     require(path.ok(), "config path should resolve");
                     require(path.value() == workspace.path() / "custom.toml", "env path ignored");
                   }});

  tests.push_back({"config_path_defaults_under_home", [] {
                     const TempWorkspace workspace;
                     const EnvGuard env_home("HOME", workspace.path().string());
                     const EnvGuard env_path("WIREDRIVE_CONFIG_PATH", std::nullopt);
                     const auto path = cfg::config_path();
                     require(path.ok(), "config path should resolve");
                     require(path.value() == workspace.path() / ".wiredrive" / "config.toml",
                             "default path mismatch: " + path.value().string());
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const TempWorkspace workspace;
                     const EnvGuard env_path("WIREDRIVE_CONFIG_PATH",
                                             (workspace.path() / "absent.toml").string());
                     const EnvGuard env_binary("WIREDRIVE_DRIVER_BINARY", std::nullopt);
                     const EnvGuard env_port("WIREDRIVE_DRIVER_PORT", std::nullopt);
                     const EnvGuard env_log("WIREDRIVE_LOG_FILE", std::nullopt);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error().message);
                     const auto &driver = loaded.value().driver;
                     require(std::holds_alternative<cfg::StandaloneDriver>(driver.kind),
                             "standalone should be the default kind");
                     require(driver.port == 0, "port should default to automatic");
                     require(driver.lock_timeout.count() == 60000, "lock timeout default");
                     require(driver.start_timeout.count() == 20000, "start timeout default");
                     require(driver.probe_interval.count() == 1000, "probe interval default");
                     require(loaded.value().observability.backend == "none", "backend default");
                   }});

  tests.push_back({"parse_config_standalone_driver", [] {
                     const auto parsed = cfg::parse_config(R"(
[driver]
kind = "standalone"
binary = "/usr/bin/chromedriver"
port = 9600
start_timeout_ms = 5000
log_path = ""
http_threads = 8
url_base = "/wd/hub"
log_file = "/tmp/driver-output.log"

[driver.env]
DISPLAY = ":99"

[observability]
backend = "log"
)");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     const auto &driver = parsed.value().driver;
                     const auto *standalone = std::get_if<cfg::StandaloneDriver>(&driver.kind);
                     require(standalone != nullptr, "standalone kind expected");
                     require(standalone->log_path.empty(), "empty log path should be kept");
                     require(standalone->http_threads == 8, "http threads mismatch");
                     require(standalone->url_base == "/wd/hub", "url base mismatch");
                     require(driver.binary == "/usr/bin/chromedriver", "binary mismatch");
                     require(driver.port == 9600, "port mismatch");
                     require(driver.start_timeout.count() == 5000, "start timeout mismatch");
                     require(driver.log_file == "/tmp/driver-output.log", "log file mismatch");
                     require(driver.env.size() == 1 && driver.env.at("DISPLAY") == ":99",
                             "env mismatch");
                     require(parsed.value().observability.backend == "log", "backend mismatch");
                   }});

  tests.push_back({"parse_config_extension_driver_with_preferences", [] {
                     const auto parsed = cfg::parse_config(R"(
[driver]
kind = "extension"
binary = "firefox"
extension_archive = "/opt/webdriver.xpi"
log_dir = "/var/log/wiredrive"
delete_profile_on_stop = false

[preferences]
"browser.startup.page" = 0
"app.update.enabled" = false
"browser.startup.homepage" = "about:blank"
"layout.css.devPixelsPerPx" = 1.5
)");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error().message);
                     const auto *extension =
                         std::get_if<cfg::ExtensionDriver>(&parsed.value().driver.kind);
                     require(extension != nullptr, "extension kind expected");
                     require(extension->extension_archive == "/opt/webdriver.xpi", "archive mismatch");
                     require(extension->log_dir == "/var/log/wiredrive", "log dir mismatch");
                     require(!extension->delete_profile_on_stop, "delete flag mismatch");
                     const auto &prefs = extension->preferences;
                     require(prefs.size() == 4, "four preferences expected");
                     require(std::get<std::int64_t>(prefs.at("browser.startup.page")) == 0,
                             "integer preference mismatch");
                     require(!std::get<bool>(prefs.at("app.update.enabled")), "bool preference mismatch");
                     require(std::get<std::string>(prefs.at("browser.startup.homepage")) == "about:blank",
                             "string preference mismatch");
                     require(std::holds_alternative<double>(prefs.at("layout.css.devPixelsPerPx")),
                             "float preference should parse as double");
                   }});

  tests.push_back({"parse_config_rejects_unknown_kind", [] {
                     const auto parsed = cfg::parse_config("[driver]\nkind = \"selenium-grid\"\n");
                     require(!parsed.ok(), "unknown kind should fail");
                     require(parsed.error().kind == wiredrive::common::ErrorKind::Config,
                             "config error expected");
                     require(parsed.error().message.find("selenium-grid") != std::string::npos,
                             "message should name the kind");
                   }});

  tests.push_back({"parse_config_rejects_out_of_range_port", [] {
                     const auto parsed = cfg::parse_config("[driver]\nport = 70000\n");
                     require(!parsed.ok(), "port above 65535 should fail");
                   }});

  tests.push_back({"load_config_file_errors_carry_path", [] {
                     const TempWorkspace workspace;
                     const auto path = workspace.create_file("bad.toml", "[driver]\nkind = \"bogus\"\n");
                     const auto loaded = cfg::load_config(path);
                     require(!loaded.ok(), "bad file should fail");
                     require(loaded.error().message.find(path.string()) == 0,
                             "message should start with the path");
                   }});

  tests.push_back({"env_overrides_win_over_file", [] {
                     const TempWorkspace workspace;
                     const auto path = workspace.create_file(
                         "config.toml", "[driver]\nbinary = \"/from/file\"\nport = 1234\n");
                     const EnvGuard env_path("WIREDRIVE_CONFIG_PATH", path.string());
                     const EnvGuard env_binary("WIREDRIVE_DRIVER_BINARY", "/from/env");
                     const EnvGuard env_port("WIREDRIVE_DRIVER_PORT", "4444");
                     const EnvGuard env_log("WIREDRIVE_LOG_FILE", "/tmp/env.log");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error().message);
                     require(loaded.value().driver.binary == "/from/env", "binary override failed");
                     require(loaded.value().driver.port == 4444, "port override failed");
                     require(loaded.value().driver.log_file == "/tmp/env.log", "log override failed");
                   }});

  tests.push_back({"env_port_override_ignores_garbage", [] {
                     cfg::Config config;
                     config.driver.port = 1234;
                     const EnvGuard env_port("WIREDRIVE_DRIVER_PORT", "not-a-port");
                     cfg::apply_env_overrides(config);
                     require(config.driver.port == 1234, "invalid env port should be ignored");
                   }});

  tests.push_back({"validate_config_hard_failures", [] {
                     cfg::Config config;
                     require(!cfg::validate_config(config).ok(), "empty binary should fail");

                     config.driver.binary = "chromedriver";
                     require(cfg::validate_config(config).ok(), "defaults should validate");

                     config.driver.start_timeout = std::chrono::milliseconds(0);
                     require(!cfg::validate_config(config).ok(), "zero timeout should fail");
                     config.driver.start_timeout = std::chrono::milliseconds(1000);

                     config.driver.kind = cfg::StandaloneDriver{.http_threads = 0};
                     require(!cfg::validate_config(config).ok(), "zero threads should fail");

                     config.driver.kind = cfg::ExtensionDriver{};
                     const auto missing_archive = cfg::validate_config(config);
                     require(!missing_archive.ok(), "missing archive should fail");
                     require(missing_archive.error().message.find("extension_archive") !=
                                 std::string::npos,
                             "message should name the archive key");
                   }});

  tests.push_back({"validate_config_soft_warnings", [] {
                     cfg::Config config;
                     config.driver.binary = "firefox";
                     cfg::ExtensionDriver extension;
                     extension.extension_archive = "/opt/webdriver.xpi";
                     extension.preferences["layout.scale"] = 1.5;
                     config.driver.kind = extension;
                     config.driver.probe_interval = std::chrono::milliseconds(30000);
                     config.observability.backend = "prometheus";

                     const auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), "soft issues should not fail validation");
                     require(warnings.value().size() == 3, "three warnings expected");
                   }});

  tests.push_back({"parse_preference_value_types", [] {
                     const auto integer = cfg::parse_preference_value("42");
                     require(integer.ok() && std::get<std::int64_t>(integer.value()) == 42, "int");
                     const auto boolean = cfg::parse_preference_value("true");
                     require(boolean.ok() && std::get<bool>(boolean.value()), "bool");
                     const auto text = cfg::parse_preference_value("\"a \\\"b\\\"\"");
                     require(text.ok() && std::get<std::string>(text.value()) == "a \"b\"", "string");
                     const auto list = cfg::parse_preference_value("[\"x\", \"y\"]");
                     require(list.ok() && std::get<std::vector<std::string>>(list.value()).size() == 2,
                             "list");
                     require(!cfg::parse_preference_value("bare words").ok(), "garbage should fail");
                   }});

  tests.push_back({"driver_kind_helpers", [] {
                     require(cfg::driver_kind_name(cfg::StandaloneDriver{}) == "standalone", "name");
                     require(cfg::driver_kind_name(cfg::ExtensionDriver{}) == "extension", "name");
                     require(cfg::default_base_port(cfg::StandaloneDriver{}) == 9515, "base port");
                     require(cfg::default_base_port(cfg::ExtensionDriver{}) == 7055, "base port");
                   }});
}
