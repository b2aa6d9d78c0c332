#pragma once

#include "wiredrive/common/result.hpp"
#include "wiredrive/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wiredrive::config {

/// `$WIREDRIVE_CONFIG_PATH`, else `~/.wiredrive/config.toml`.
[[nodiscard]] common::Result<std::filesystem::path> config_path();

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &path);

/// Loads the file at config_path() when it exists, defaults otherwise, then
/// applies environment overrides.
[[nodiscard]] common::Result<Config> load_config();

void apply_env_overrides(Config &config);

/// Hard errors fail; soft issues come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

[[nodiscard]] common::Result<PreferenceValue> parse_preference_value(const std::string &raw);

} // namespace wiredrive::config
