#pragma once

#include "wiredrive/common/result.hpp"

#include <filesystem>
#include <string>

namespace wiredrive::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Creates `<parent>/<prefix>-XXXXXX`; an empty parent means the system temp directory.
[[nodiscard]] Result<std::filesystem::path> make_temp_dir(const std::string &prefix,
                                                          const std::filesystem::path &parent = {});
[[nodiscard]] Status remove_tree(const std::filesystem::path &path);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace wiredrive::common
