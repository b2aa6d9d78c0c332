#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wiredrive::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escaped and wrapped in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape the inside of a JSON string literal, including \uXXXX sequences.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// True when `text` is exactly one well-formed JSON value (surrounding whitespace allowed).
[[nodiscard]] bool json_validate(const std::string &text);

[[nodiscard]] bool json_is_object(const std::string &text);
[[nodiscard]] bool json_is_null(const std::string &text);

/// Top-level members of an object as raw (undecoded) JSON text.
/// Empty optional when `object_json` is not a well-formed object.
using JsonFields = std::map<std::string, std::string>;
[[nodiscard]] std::optional<JsonFields> json_top_level_fields(const std::string &object_json);

/// Case-insensitive member lookup; a null member counts as missing.
[[nodiscard]] std::optional<std::string> json_member(const JsonFields &fields,
                                                     const std::string &name);

/// Elements of a well-formed array as raw JSON text.
[[nodiscard]] std::optional<std::vector<std::string>>
json_split_top_level_values(const std::string &array_json);

[[nodiscard]] std::optional<std::string> json_decode_string(const std::string &raw);
[[nodiscard]] std::optional<bool> json_decode_bool(const std::string &raw);
[[nodiscard]] std::optional<std::int64_t> json_decode_int(const std::string &raw);
[[nodiscard]] std::optional<double> json_decode_double(const std::string &raw);
[[nodiscard]] std::optional<std::vector<std::string>>
json_decode_string_array(const std::string &raw);

/// Builds `{"k":v,...}` from already-encoded member values, in the given order.
[[nodiscard]] std::string
json_object(const std::vector<std::pair<std::string, std::string>> &members);
[[nodiscard]] std::string json_array(const std::vector<std::string> &raw_values);
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace wiredrive::common
