#include "wiredrive/config/schema.hpp"

#include <type_traits>

namespace wiredrive::config {

std::string driver_kind_name(const DriverKind &kind) {
  return std::visit(
      [](const auto &driver) -> std::string {
        using T = std::decay_t<decltype(driver)>;
        if constexpr (std::is_same_v<T, StandaloneDriver>) {
          return "standalone";
        } else {
          return "extension";
        }
      },
      kind);
}

std::uint16_t default_base_port(const DriverKind &kind) {
  return std::holds_alternative<ExtensionDriver>(kind) ? kExtensionBasePort : kStandaloneBasePort;
}

std::string preference_type_name(const PreferenceValue &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return "boolean";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return "integer";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return "string";
        } else if constexpr (std::is_same_v<T, double>) {
          return "float";
        } else {
          return "array";
        }
      },
      value);
}

} // namespace wiredrive::config
