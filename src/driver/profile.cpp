#include "wiredrive/driver/profile.hpp"

#include "wiredrive/common/fs.hpp"
#include "wiredrive/common/json_util.hpp"

#include <fstream>
#include <memory>
#include <sstream>
#include <string_view>
#include <type_traits>

#include <libxml/parser.h>
#include <libxml/tree.h>

namespace wiredrive::driver {

namespace {

constexpr const char *kProfilePrefix = "create profile failed: ";
constexpr const char *kUserPrefsFile = "user.js";

std::string local_name(const std::string &qualified) {
  const auto colon = qualified.find(':');
  return colon == std::string::npos ? qualified : qualified.substr(colon + 1);
}

std::optional<std::string> non_empty(std::string value) {
  value = common::trim(value);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string xml_string(const xmlChar *text) {
  if (text == nullptr) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char *>(text));
}

// Copies and releases a string libxml2 allocated for the caller.
std::string take_xml_string(xmlChar *text) {
  std::string out = xml_string(text);
  if (text != nullptr) {
    xmlFree(text);
  }
  return out;
}

std::string xml_local_name(const xmlChar *name) { return local_name(xml_string(name)); }

std::optional<std::string> render_preference(const config::PreferenceValue &value) {
  return std::visit(
      [](const auto &v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return std::string(v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return common::json_quote(v);
        } else {
          return std::nullopt;
        }
      },
      value);
}

common::Status write_text_file(const std::filesystem::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Status::error(common::io_error("unable to create " + path.string()));
  }
  out << content;
  out.close();
  if (!out) {
    return common::Status::error(common::io_error("unable to write " + path.string()));
  }
  std::error_code ec;
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    return common::Status::error(
        common::io_error("unable to restrict permissions of " + path.string()));
  }
  return common::Status::success();
}

} // namespace

std::optional<std::string> parse_install_rdf_id(const std::string &xml) {
  xmlInitParser();
  const std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)> doc(
      xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "install.rdf", nullptr,
                    XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
      &xmlFreeDoc);
  if (doc == nullptr) {
    return std::nullopt;
  }
  const xmlNode *root = xmlDocGetRootElement(doc.get());
  if (root == nullptr) {
    return std::nullopt;
  }

  for (const xmlNode *node = root->children; node != nullptr; node = node->next) {
    if (node->type != XML_ELEMENT_NODE || xml_local_name(node->name) != "Description") {
      continue;
    }
    for (const xmlAttr *attr = node->properties; attr != nullptr; attr = attr->next) {
      if (xml_local_name(attr->name) != "id") {
        continue;
      }
      if (auto id = non_empty(take_xml_string(xmlNodeListGetString(doc.get(), attr->children, 1)));
          id.has_value()) {
        return id;
      }
    }
    for (const xmlNode *child = node->children; child != nullptr; child = child->next) {
      if (child->type == XML_ELEMENT_NODE && xml_local_name(child->name) == "id") {
        return non_empty(take_xml_string(xmlNodeGetContent(child)));
      }
    }
    // Only the first top-level Description describes the extension itself.
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<std::string> parse_manifest_json_id(const std::string &json) {
  const auto manifest = common::json_top_level_fields(json);
  if (!manifest.has_value()) {
    return std::nullopt;
  }
  for (const char *settings_key : {"browser_specific_settings", "applications"}) {
    const auto settings_it = manifest->find(settings_key);
    if (settings_it == manifest->end()) {
      continue;
    }
    const auto settings = common::json_top_level_fields(settings_it->second);
    if (!settings.has_value() || !settings->contains("gecko")) {
      continue;
    }
    const auto gecko = common::json_top_level_fields(settings->at("gecko"));
    if (!gecko.has_value() || !gecko->contains("id")) {
      continue;
    }
    if (auto id = common::json_decode_string(gecko->at("id")); id.has_value()) {
      if (auto trimmed = non_empty(*id); trimmed.has_value()) {
        return trimmed;
      }
    }
  }
  return std::nullopt;
}

common::Result<std::string> read_extension_id(const ZipArchive &archive) {
  if (const auto *rdf = archive.find("install.rdf"); rdf != nullptr) {
    auto content = archive.read(*rdf);
    if (!content.ok()) {
      return common::Result<std::string>::failure(content.error());
    }
    if (auto id = parse_install_rdf_id(content.value()); id.has_value()) {
      return common::Result<std::string>::success(*id);
    }
    return common::Result<std::string>::failure(
        common::config_error("unable to find extension id from install.rdf"));
  }

  if (const auto *manifest = archive.find("manifest.json"); manifest != nullptr) {
    auto content = archive.read(*manifest);
    if (!content.ok()) {
      return common::Result<std::string>::failure(content.error());
    }
    if (auto id = parse_manifest_json_id(content.value()); id.has_value()) {
      return common::Result<std::string>::success(*id);
    }
    return common::Result<std::string>::failure(
        common::config_error("unable to find extension id from manifest.json"));
  }

  return common::Result<std::string>::failure(
      common::config_error("unable to find extension id: archive has no manifest"));
}

common::Result<std::string> render_user_prefs(const config::Preferences &preferences) {
  std::ostringstream out;
  for (const auto &[key, value] : preferences) {
    const auto rendered = render_preference(value);
    if (!rendered.has_value()) {
      return common::Result<std::string>::failure(common::config_error(
          "unexpected preference type " + config::preference_type_name(value) + ": " + key));
    }
    out << "user_pref(" << common::json_quote(key) << ", " << *rendered << ");\n";
  }
  return common::Result<std::string>::success(out.str());
}

common::Result<config::Preferences> parse_user_prefs(const std::string &text) {
  config::Preferences preferences;
  std::istringstream stream(text);
  std::string line;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string trimmed = common::trim(line);
    if (trimmed.empty() || common::starts_with(trimmed, "//")) {
      continue;
    }
    const auto invalid = [&]() {
      return common::Result<config::Preferences>::failure(
          common::config_error("invalid user_pref at line " + std::to_string(line_number)));
    };

    constexpr std::string_view kOpen = "user_pref(";
    constexpr std::string_view kClose = ");";
    if (!common::starts_with(trimmed, std::string(kOpen)) || trimmed.size() < kOpen.size() + 2 ||
        trimmed.compare(trimmed.size() - kClose.size(), kClose.size(), kClose) != 0) {
      return invalid();
    }
    const std::string inner =
        common::trim(trimmed.substr(kOpen.size(), trimmed.size() - kOpen.size() - kClose.size()));
    if (inner.empty() || inner.front() != '"') {
      return invalid();
    }
    const auto key_end = common::json_find_string_end(inner, 0);
    if (key_end == std::string::npos) {
      return invalid();
    }
    const auto key = common::json_decode_string(inner.substr(0, key_end + 1));
    const auto comma = common::json_skip_ws(inner, key_end + 1);
    if (!key.has_value() || comma >= inner.size() || inner[comma] != ',') {
      return invalid();
    }
    const std::string raw = common::trim(inner.substr(comma + 1));

    if (const auto flag = common::json_decode_bool(raw); flag.has_value()) {
      preferences[*key] = *flag;
    } else if (const auto number = common::json_decode_int(raw); number.has_value()) {
      preferences[*key] = *number;
    } else if (const auto str = common::json_decode_string(raw); str.has_value()) {
      preferences[*key] = *str;
    } else {
      return invalid();
    }
  }
  return common::Result<config::Preferences>::success(std::move(preferences));
}

void set_log_directory(config::Preferences &preferences, const std::filesystem::path &directory) {
  preferences["webdriver.log.file"] = (directory / "jsconsole.log").string();
  preferences["webdriver.log.driver.file"] = (directory / "driver.log").string();
  preferences["webdriver.log.profiler.file"] = (directory / "profiler.log").string();
  preferences["webdriver.log.browser.file"] = (directory / "browser.log").string();
}

ProfileBuilder::ProfileBuilder(std::filesystem::path extension_archive,
                               config::Preferences preferences, std::filesystem::path temp_root)
    : extension_archive_(std::move(extension_archive)), preferences_(std::move(preferences)),
      temp_root_(std::move(temp_root)) {}

common::Result<Profile> ProfileBuilder::build() const {
  auto directory = common::make_temp_dir("wiredrive-profile", temp_root_);
  if (!directory.ok()) {
    return common::Result<Profile>::failure(directory.error().with_prefix(kProfilePrefix));
  }

  std::string extension_id;
  if (auto status = populate(directory.value(), extension_id); !status.ok()) {
    common::Error error = status.error().with_prefix(kProfilePrefix);
    if (auto cleanup = common::remove_tree(directory.value()); !cleanup.ok()) {
      error.message += " (cleanup: " + cleanup.error().message + ")";
    }
    return common::Result<Profile>::failure(std::move(error));
  }

  return common::Result<Profile>::success(
      Profile{.directory = directory.value(), .extension_id = std::move(extension_id)});
}

common::Status ProfileBuilder::populate(const std::filesystem::path &directory,
                                        std::string &extension_id) const {
  // Render first so a bad preference fails before anything is unpacked.
  auto user_prefs = render_user_prefs(preferences_);
  if (!user_prefs.ok()) {
    return common::Status::error(user_prefs.error());
  }

  auto archive = ZipArchive::open(extension_archive_);
  if (!archive.ok()) {
    return common::Status::error(archive.error());
  }

  auto id = read_extension_id(archive.value());
  if (!id.ok()) {
    return common::Status::error(id.error());
  }
  if (!is_safe_entry_name(id.value()) || id.value().find_first_of("/\\") != std::string::npos) {
    return common::Status::error(
        common::config_error("extension id is not a valid directory name: " + id.value()));
  }

  const auto extension_dir = directory / "extensions" / id.value();
  if (auto created = common::ensure_dir(extension_dir); !created.ok()) {
    return common::Status::error(created.error());
  }
  if (auto extracted = archive.value().extract_all(extension_dir); !extracted.ok()) {
    return extracted;
  }

  if (auto written = write_text_file(directory / kUserPrefsFile, user_prefs.value());
      !written.ok()) {
    return written;
  }

  extension_id = id.value();
  return common::Status::success();
}

} // namespace wiredrive::driver
