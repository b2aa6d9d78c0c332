#include "wiredrive/common/json_util.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace wiredrive::common {

namespace {

constexpr std::size_t kMaxDepth = 256;

bool is_digit(const char ch) { return ch >= '0' && ch <= '9'; }

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool read_hex4(const std::string &text, const std::size_t pos, unsigned int &out) {
  if (pos + 4 > text.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(text[i]);
    if (digit < 0) {
      return false;
    }
    out = (out << 4U) | static_cast<unsigned int>(digit);
  }
  return true;
}

void append_utf8(std::string &out, const unsigned int code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

// Recursive-descent scanner. Each parse_* advances `pos` past the construct
// and returns false on malformed input.
class Scanner {
public:
  explicit Scanner(const std::string &text) : text_(text) {}

  bool parse_value(std::size_t &pos, const std::size_t depth) {
    if (depth > kMaxDepth) {
      return false;
    }
    pos = json_skip_ws(text_, pos);
    if (pos >= text_.size()) {
      return false;
    }
    switch (text_[pos]) {
    case '{':
      return parse_object(pos, depth);
    case '[':
      return parse_array(pos, depth);
    case '"':
      return parse_string(pos);
    case 't':
      return parse_literal(pos, "true");
    case 'f':
      return parse_literal(pos, "false");
    case 'n':
      return parse_literal(pos, "null");
    default:
      return parse_number(pos);
    }
  }

  bool parse_string(std::size_t &pos) {
    if (pos >= text_.size() || text_[pos] != '"') {
      return false;
    }
    ++pos;
    while (pos < text_.size()) {
      const auto ch = static_cast<unsigned char>(text_[pos]);
      if (ch == '"') {
        ++pos;
        return true;
      }
      if (ch < 0x20) {
        return false;
      }
      if (ch == '\\') {
        if (pos + 1 >= text_.size()) {
          return false;
        }
        const char esc = text_[pos + 1];
        if (esc == 'u') {
          unsigned int ignored = 0;
          if (!read_hex4(text_, pos + 2, ignored)) {
            return false;
          }
          pos += 6;
          continue;
        }
        if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
            esc != 'r' && esc != 't') {
          return false;
        }
        pos += 2;
        continue;
      }
      ++pos;
    }
    return false;
  }

private:
  bool parse_object(std::size_t &pos, const std::size_t depth) {
    ++pos;
    pos = json_skip_ws(text_, pos);
    if (pos < text_.size() && text_[pos] == '}') {
      ++pos;
      return true;
    }
    while (true) {
      pos = json_skip_ws(text_, pos);
      if (!parse_string(pos)) {
        return false;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size() || text_[pos] != ':') {
        return false;
      }
      ++pos;
      if (!parse_value(pos, depth + 1)) {
        return false;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return false;
      }
      if (text_[pos] == ',') {
        ++pos;
        continue;
      }
      if (text_[pos] == '}') {
        ++pos;
        return true;
      }
      return false;
    }
  }

  bool parse_array(std::size_t &pos, const std::size_t depth) {
    ++pos;
    pos = json_skip_ws(text_, pos);
    if (pos < text_.size() && text_[pos] == ']') {
      ++pos;
      return true;
    }
    while (true) {
      if (!parse_value(pos, depth + 1)) {
        return false;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return false;
      }
      if (text_[pos] == ',') {
        ++pos;
        continue;
      }
      if (text_[pos] == ']') {
        ++pos;
        return true;
      }
      return false;
    }
  }

  bool parse_literal(std::size_t &pos, const std::string &literal) {
    if (text_.compare(pos, literal.size(), literal) != 0) {
      return false;
    }
    pos += literal.size();
    return true;
  }

  bool parse_number(std::size_t &pos) {
    const std::size_t start = pos;
    if (pos < text_.size() && text_[pos] == '-') {
      ++pos;
    }
    if (pos >= text_.size() || !is_digit(text_[pos])) {
      return false;
    }
    if (text_[pos] == '0') {
      ++pos;
    } else {
      while (pos < text_.size() && is_digit(text_[pos])) {
        ++pos;
      }
    }
    if (pos < text_.size() && text_[pos] == '.') {
      ++pos;
      if (pos >= text_.size() || !is_digit(text_[pos])) {
        return false;
      }
      while (pos < text_.size() && is_digit(text_[pos])) {
        ++pos;
      }
    }
    if (pos < text_.size() && (text_[pos] == 'e' || text_[pos] == 'E')) {
      ++pos;
      if (pos < text_.size() && (text_[pos] == '+' || text_[pos] == '-')) {
        ++pos;
      }
      if (pos >= text_.size() || !is_digit(text_[pos])) {
        return false;
      }
      while (pos < text_.size() && is_digit(text_[pos])) {
        ++pos;
      }
    }
    return pos > start;
  }

  const std::string &text_;
};

std::string trim_ws(const std::string &raw) {
  const std::size_t first = json_skip_ws(raw, 0);
  std::size_t last = raw.size();
  while (last > first && std::isspace(static_cast<unsigned char>(raw[last - 1])) != 0) {
    --last;
  }
  return raw.substr(first, last - first);
}

std::string to_lower_ascii(std::string value) {
  for (auto &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr char kHex[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(kHex[(static_cast<unsigned char>(ch) >> 4U) & 0x0FU]);
        escaped.push_back(kHex[static_cast<unsigned char>(ch) & 0x0FU]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned int code = 0;
      if (!read_hex4(raw, i + 1, code)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      if (code >= 0xD800 && code <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        unsigned int low = 0;
        if (read_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

bool json_validate(const std::string &text) {
  Scanner scanner(text);
  std::size_t pos = 0;
  if (!scanner.parse_value(pos, 0)) {
    return false;
  }
  return json_skip_ws(text, pos) == text.size();
}

bool json_is_object(const std::string &text) {
  const std::size_t first = json_skip_ws(text, 0);
  return first < text.size() && text[first] == '{' && json_validate(text);
}

bool json_is_null(const std::string &text) { return trim_ws(text) == "null"; }

std::optional<JsonFields> json_top_level_fields(const std::string &object_json) {
  if (!json_is_object(object_json)) {
    return std::nullopt;
  }

  Scanner scanner(object_json);
  JsonFields fields;
  std::size_t pos = json_skip_ws(object_json, 0) + 1;
  while (true) {
    pos = json_skip_ws(object_json, pos);
    if (object_json[pos] == '}') {
      break;
    }
    if (object_json[pos] == ',') {
      ++pos;
      continue;
    }
    const std::size_t key_start = pos;
    if (!scanner.parse_string(pos)) {
      return std::nullopt;
    }
    std::string key = json_unescape(object_json.substr(key_start + 1, pos - key_start - 2));
    pos = json_skip_ws(object_json, pos) + 1; // past ':'
    const std::size_t value_start = json_skip_ws(object_json, pos);
    pos = value_start;
    if (!scanner.parse_value(pos, 1)) {
      return std::nullopt;
    }
    fields[std::move(key)] = object_json.substr(value_start, pos - value_start);
  }
  return fields;
}

std::optional<std::string> json_member(const JsonFields &fields, const std::string &name) {
  if (const auto exact = fields.find(name); exact != fields.end()) {
    if (json_is_null(exact->second)) {
      return std::nullopt;
    }
    return exact->second;
  }
  const std::string wanted = to_lower_ascii(name);
  for (const auto &[key, raw] : fields) {
    if (to_lower_ascii(key) == wanted) {
      if (json_is_null(raw)) {
        return std::nullopt;
      }
      return raw;
    }
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>>
json_split_top_level_values(const std::string &array_json) {
  const std::size_t first = json_skip_ws(array_json, 0);
  if (first >= array_json.size() || array_json[first] != '[' || !json_validate(array_json)) {
    return std::nullopt;
  }

  Scanner scanner(array_json);
  std::vector<std::string> out;
  std::size_t pos = first + 1;
  while (true) {
    pos = json_skip_ws(array_json, pos);
    if (array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const std::size_t value_start = pos;
    if (!scanner.parse_value(pos, 1)) {
      return std::nullopt;
    }
    out.push_back(array_json.substr(value_start, pos - value_start));
  }
  return out;
}

std::optional<std::string> json_decode_string(const std::string &raw) {
  const std::string value = trim_ws(raw);
  if (value.size() < 2 || value.front() != '"' || !json_validate(value)) {
    return std::nullopt;
  }
  return json_unescape(value.substr(1, value.size() - 2));
}

std::optional<bool> json_decode_bool(const std::string &raw) {
  const std::string value = trim_ws(raw);
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::int64_t> json_decode_int(const std::string &raw) {
  const std::string value = trim_ws(raw);
  std::int64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<double> json_decode_double(const std::string &raw) {
  const std::string value = trim_ws(raw);
  if (value.empty() || value.front() == '"' || !json_validate(value)) {
    return std::nullopt;
  }
  char *end = nullptr;
  errno = 0;
  const double parsed = std::strtod(value.c_str(), &end);
  if (errno != 0 || end != value.c_str() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::vector<std::string>> json_decode_string_array(const std::string &raw) {
  const auto elements = json_split_top_level_values(raw);
  if (!elements.has_value()) {
    return std::nullopt;
  }
  std::vector<std::string> out;
  out.reserve(elements->size());
  for (const auto &element : *elements) {
    auto decoded = json_decode_string(element);
    if (!decoded.has_value()) {
      return std::nullopt;
    }
    out.push_back(std::move(*decoded));
  }
  return out;
}

std::string json_object(const std::vector<std::pair<std::string, std::string>> &members) {
  std::ostringstream body;
  body << "{";
  bool first = true;
  for (const auto &[key, raw] : members) {
    if (!first) {
      body << ",";
    }
    first = false;
    body << json_quote(key) << ":" << raw;
  }
  body << "}";
  return body.str();
}

std::string json_array(const std::vector<std::string> &raw_values) {
  std::ostringstream body;
  body << "[";
  for (std::size_t i = 0; i < raw_values.size(); ++i) {
    if (i > 0) {
      body << ",";
    }
    body << raw_values[i];
  }
  body << "]";
  return body.str();
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::vector<std::string> quoted;
  quoted.reserve(values.size());
  for (const auto &value : values) {
    quoted.push_back(json_quote(value));
  }
  return json_array(quoted);
}

} // namespace wiredrive::common
