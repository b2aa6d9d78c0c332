#pragma once

#include "wiredrive/common/result.hpp"
#include "wiredrive/config/schema.hpp"
#include "wiredrive/driver/zip_archive.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace wiredrive::driver {

struct Profile {
  std::filesystem::path directory;
  std::string extension_id;
};

/// Builds a disposable browser profile: the extension archive exploded under
/// `extensions/<id>/` plus a `user.js` holding the preferences.
class ProfileBuilder {
public:
  ProfileBuilder(std::filesystem::path extension_archive, config::Preferences preferences,
                 std::filesystem::path temp_root = {});

  /// On failure nothing is left on disk and the message starts with
  /// "create profile failed: ".
  [[nodiscard]] common::Result<Profile> build() const;

private:
  [[nodiscard]] common::Status populate(const std::filesystem::path &directory,
                                        std::string &extension_id) const;

  std::filesystem::path extension_archive_;
  config::Preferences preferences_;
  std::filesystem::path temp_root_;
};

/// `id` of the first top-level Description element of an install.rdf, either
/// as a child element or as an attribute.
[[nodiscard]] std::optional<std::string> parse_install_rdf_id(const std::string &xml);

/// `browser_specific_settings.gecko.id`, else `applications.gecko.id`.
[[nodiscard]] std::optional<std::string> parse_manifest_json_id(const std::string &json);

[[nodiscard]] common::Result<std::string> read_extension_id(const ZipArchive &archive);

[[nodiscard]] common::Result<std::string> render_user_prefs(const config::Preferences &preferences);
[[nodiscard]] common::Result<config::Preferences> parse_user_prefs(const std::string &text);

/// Points the webdriver.log.* preferences at files inside `directory`.
void set_log_directory(config::Preferences &preferences, const std::filesystem::path &directory);

} // namespace wiredrive::driver
