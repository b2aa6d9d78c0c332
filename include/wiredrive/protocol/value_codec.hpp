#pragma once

#include "wiredrive/common/result.hpp"
#include "wiredrive/protocol/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace wiredrive::protocol {

// Decoders for the raw `value` member of command replies. Each fails with a
// protocol error naming the offending JSON.

[[nodiscard]] common::Result<std::string> decode_string_value(const std::string &raw);
[[nodiscard]] common::Result<bool> decode_bool_value(const std::string &raw);
[[nodiscard]] common::Result<std::vector<std::string>>
decode_string_list_value(const std::string &raw);
[[nodiscard]] common::Result<Capabilities> decode_capabilities(const std::string &raw);
[[nodiscard]] common::Result<ServerStatus> decode_server_status(const std::string &raw);
[[nodiscard]] common::Result<Size> decode_size(const std::string &raw);
[[nodiscard]] common::Result<Position> decode_position(const std::string &raw);
[[nodiscard]] common::Result<std::vector<Cookie>> decode_cookies(const std::string &raw);

/// Element reference id from `{"ELEMENT": id}` or the W3C element key.
[[nodiscard]] common::Result<std::string> decode_element_id(const std::string &raw);
[[nodiscard]] common::Result<std::vector<std::string>> decode_element_ids(const std::string &raw);

/// Standard base64 (padding required, line breaks ignored) to bytes.
[[nodiscard]] common::Result<std::vector<std::uint8_t>> decode_base64(const std::string &text);

[[nodiscard]] std::string encode_cookie(const Cookie &cookie);
[[nodiscard]] std::string encode_capabilities(const Capabilities &capabilities);
[[nodiscard]] std::string encode_element_reference(const std::string &element_id);

/// Splits a key sequence into one string per UTF-8 code point.
[[nodiscard]] std::vector<std::string> split_key_sequence(const std::string &sequence);

} // namespace wiredrive::protocol
