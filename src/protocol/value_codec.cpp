#include "wiredrive/protocol/value_codec.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace wiredrive::protocol {

namespace {

constexpr const char *kElementKey = "ELEMENT";
constexpr const char *kW3cElementKey = "element-6066-11e4-a52e-4f713b9a1c98";

template <typename T> common::Result<T> unexpected(const std::string &what, const std::string &raw) {
  return common::Result<T>::failure(
      common::protocol_error("unexpected value for " + what + ": " + raw));
}

std::optional<common::JsonFields> object_fields(const std::string &raw) {
  return common::json_top_level_fields(raw);
}

// Coordinates may come back as fractional numbers.
std::optional<int> decode_coordinate(const std::string &raw) {
  if (const auto integer = common::json_decode_int(raw); integer.has_value()) {
    if (*integer < std::numeric_limits<int>::min() || *integer > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
    return static_cast<int>(*integer);
  }
  const auto real = common::json_decode_double(raw);
  if (!real.has_value() || !std::isfinite(*real) ||
      *real < static_cast<double>(std::numeric_limits<int>::min()) ||
      *real > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(*real);
}

bool read_string(const common::JsonFields &fields, const std::string &name, std::string &out) {
  const auto raw = common::json_member(fields, name);
  if (!raw.has_value()) {
    return true;
  }
  auto decoded = common::json_decode_string(*raw);
  if (!decoded.has_value()) {
    return false;
  }
  out = std::move(*decoded);
  return true;
}

bool read_int_pair(const std::string &raw, const std::string &first, const std::string &second,
                   int &a, int &b) {
  const auto fields = object_fields(raw);
  if (!fields.has_value()) {
    return false;
  }
  const auto raw_a = common::json_member(*fields, first);
  const auto raw_b = common::json_member(*fields, second);
  if (!raw_a.has_value() || !raw_b.has_value()) {
    return false;
  }
  const auto va = decode_coordinate(*raw_a);
  const auto vb = decode_coordinate(*raw_b);
  if (!va.has_value() || !vb.has_value()) {
    return false;
  }
  a = *va;
  b = *vb;
  return true;
}

std::optional<Cookie> decode_cookie(const std::string &raw) {
  const auto fields = object_fields(raw);
  if (!fields.has_value()) {
    return std::nullopt;
  }
  Cookie cookie;
  if (!read_string(*fields, "name", cookie.name) || !read_string(*fields, "value", cookie.value) ||
      !read_string(*fields, "path", cookie.path) ||
      !read_string(*fields, "domain", cookie.domain)) {
    return std::nullopt;
  }
  if (const auto secure = common::json_member(*fields, "secure"); secure.has_value()) {
    const auto flag = common::json_decode_bool(*secure);
    if (!flag.has_value()) {
      return std::nullopt;
    }
    cookie.secure = *flag;
  }
  if (const auto expiry = common::json_member(*fields, "expiry"); expiry.has_value()) {
    if (const auto whole = common::json_decode_int(*expiry); whole.has_value()) {
      cookie.expiry = *whole;
    } else if (const auto real = common::json_decode_double(*expiry);
               real.has_value() && std::isfinite(*real)) {
      cookie.expiry = static_cast<std::int64_t>(*real);
    } else {
      return std::nullopt;
    }
  }
  return cookie;
}

} // namespace

std::string_view locator_strategy_name(const LocatorStrategy strategy) {
  switch (strategy) {
  case LocatorStrategy::ClassName:
    return "class name";
  case LocatorStrategy::CssSelector:
    return "css selector";
  case LocatorStrategy::Id:
    return "id";
  case LocatorStrategy::Name:
    return "name";
  case LocatorStrategy::LinkText:
    return "link text";
  case LocatorStrategy::PartialLinkText:
    return "partial link text";
  case LocatorStrategy::TagName:
    return "tag name";
  case LocatorStrategy::XPath:
    break;
  }
  return "xpath";
}

common::Result<std::string> decode_string_value(const std::string &raw) {
  auto decoded = common::json_decode_string(raw);
  if (!decoded.has_value()) {
    return unexpected<std::string>("string", raw);
  }
  return common::Result<std::string>::success(std::move(*decoded));
}

common::Result<bool> decode_bool_value(const std::string &raw) {
  const auto decoded = common::json_decode_bool(raw);
  if (!decoded.has_value()) {
    return unexpected<bool>("boolean", raw);
  }
  return common::Result<bool>::success(*decoded);
}

common::Result<std::vector<std::string>> decode_string_list_value(const std::string &raw) {
  auto decoded = common::json_decode_string_array(raw);
  if (!decoded.has_value()) {
    return unexpected<std::vector<std::string>>("string list", raw);
  }
  return common::Result<std::vector<std::string>>::success(std::move(*decoded));
}

common::Result<Capabilities> decode_capabilities(const std::string &raw) {
  if (common::json_is_null(raw)) {
    return common::Result<Capabilities>::success(Capabilities{});
  }
  auto fields = object_fields(raw);
  if (!fields.has_value()) {
    return unexpected<Capabilities>("capabilities", raw);
  }
  return common::Result<Capabilities>::success(std::move(*fields));
}

common::Result<ServerStatus> decode_server_status(const std::string &raw) {
  const auto fields = object_fields(raw);
  if (!fields.has_value()) {
    return unexpected<ServerStatus>("status", raw);
  }

  ServerStatus status;
  if (const auto build = common::json_member(*fields, "build"); build.has_value()) {
    const auto build_fields = object_fields(*build);
    if (!build_fields.has_value() ||
        !read_string(*build_fields, "version", status.build.version) ||
        !read_string(*build_fields, "revision", status.build.revision) ||
        !read_string(*build_fields, "time", status.build.time)) {
      return unexpected<ServerStatus>("status build", *build);
    }
  }
  if (const auto os = common::json_member(*fields, "os"); os.has_value()) {
    const auto os_fields = object_fields(*os);
    if (!os_fields.has_value() || !read_string(*os_fields, "arch", status.os.arch) ||
        !read_string(*os_fields, "name", status.os.name) ||
        !read_string(*os_fields, "version", status.os.version)) {
      return unexpected<ServerStatus>("status os", *os);
    }
  }
  return common::Result<ServerStatus>::success(std::move(status));
}

common::Result<Size> decode_size(const std::string &raw) {
  Size size;
  if (!read_int_pair(raw, "width", "height", size.width, size.height)) {
    return unexpected<Size>("size", raw);
  }
  return common::Result<Size>::success(size);
}

common::Result<Position> decode_position(const std::string &raw) {
  Position position;
  if (!read_int_pair(raw, "x", "y", position.x, position.y)) {
    return unexpected<Position>("position", raw);
  }
  return common::Result<Position>::success(position);
}

common::Result<std::vector<Cookie>> decode_cookies(const std::string &raw) {
  std::vector<Cookie> cookies;
  if (common::json_is_null(raw)) {
    return common::Result<std::vector<Cookie>>::success(std::move(cookies));
  }
  const auto items = common::json_split_top_level_values(raw);
  if (!items.has_value()) {
    return unexpected<std::vector<Cookie>>("cookies", raw);
  }
  for (const auto &item : *items) {
    auto cookie = decode_cookie(item);
    if (!cookie.has_value()) {
      return unexpected<std::vector<Cookie>>("cookie", item);
    }
    cookies.push_back(std::move(*cookie));
  }
  return common::Result<std::vector<Cookie>>::success(std::move(cookies));
}

common::Result<std::string> decode_element_id(const std::string &raw) {
  const auto fields = object_fields(raw);
  if (fields.has_value()) {
    for (const char *key : {kElementKey, kW3cElementKey}) {
      if (const auto it = fields->find(key); it != fields->end()) {
        if (auto id = common::json_decode_string(it->second); id.has_value()) {
          return common::Result<std::string>::success(std::move(*id));
        }
      }
    }
  }
  return unexpected<std::string>("element reference", raw);
}

common::Result<std::vector<std::string>> decode_element_ids(const std::string &raw) {
  std::vector<std::string> ids;
  const auto items = common::json_split_top_level_values(raw);
  if (!items.has_value()) {
    return unexpected<std::vector<std::string>>("element list", raw);
  }
  for (const auto &item : *items) {
    auto id = decode_element_id(item);
    if (!id.ok()) {
      return common::Result<std::vector<std::string>>::failure(id.error());
    }
    ids.push_back(std::move(id.value()));
  }
  return common::Result<std::vector<std::string>>::success(std::move(ids));
}

common::Result<std::vector<std::uint8_t>> decode_base64(const std::string &text) {
  std::string compact;
  compact.reserve(text.size());
  for (const char ch : text) {
    if (ch != '\n' && ch != '\r') {
      compact.push_back(ch);
    }
  }
  if (compact.size() % 4 != 0 ||
      compact.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return common::Result<std::vector<std::uint8_t>>::failure(
        common::protocol_error("invalid base64 length: " + std::to_string(compact.size())));
  }

  std::vector<std::uint8_t> bytes(compact.size() / 4 * 3 + 1);
  const int written =
      EVP_DecodeBlock(bytes.data(), reinterpret_cast<const unsigned char *>(compact.data()),
                      static_cast<int>(compact.size()));
  if (written < 0) {
    return common::Result<std::vector<std::uint8_t>>::failure(
        common::protocol_error("invalid base64 data"));
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (!compact.empty() && compact.back() == '=') {
    ++padding;
    if (compact.size() >= 2 && compact[compact.size() - 2] == '=') {
      ++padding;
    }
  }
  bytes.resize(static_cast<std::size_t>(written) - padding);
  return common::Result<std::vector<std::uint8_t>>::success(std::move(bytes));
}

std::string encode_cookie(const Cookie &cookie) {
  std::vector<std::pair<std::string, std::string>> members{
      {"name", common::json_quote(cookie.name)},
      {"value", common::json_quote(cookie.value)},
      {"path", common::json_quote(cookie.path)},
      {"domain", common::json_quote(cookie.domain)},
      {"secure", cookie.secure ? "true" : "false"},
  };
  if (cookie.expiry.has_value()) {
    members.emplace_back("expiry", std::to_string(*cookie.expiry));
  }
  return common::json_object(members);
}

std::string encode_capabilities(const Capabilities &capabilities) {
  std::vector<std::pair<std::string, std::string>> members(capabilities.begin(),
                                                           capabilities.end());
  return common::json_object(members);
}

std::string encode_element_reference(const std::string &element_id) {
  return common::json_object({{kElementKey, common::json_quote(element_id)}});
}

std::vector<std::string> split_key_sequence(const std::string &sequence) {
  std::vector<std::string> keys;
  std::size_t pos = 0;
  while (pos < sequence.size()) {
    const auto lead = static_cast<unsigned char>(sequence[pos]);
    std::size_t length = 1;
    if ((lead & 0xE0U) == 0xC0U) {
      length = 2;
    } else if ((lead & 0xF0U) == 0xE0U) {
      length = 3;
    } else if ((lead & 0xF8U) == 0xF0U) {
      length = 4;
    }
    length = std::min(length, sequence.size() - pos);
    keys.push_back(sequence.substr(pos, length));
    pos += length;
  }
  return keys;
}

} // namespace wiredrive::protocol
