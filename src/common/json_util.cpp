#include "tracescope/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace tracescope::common {

namespace {

constexpr std::size_t kMaxValidationDepth = 512;

int hex_digit(const char ch) {
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

bool read_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_digit(raw[i]);
    if (digit < 0) {
      return false;
    }
    out = (out << 4U) | static_cast<std::uint32_t>(digit);
  }
  return true;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool is_value_terminator(const char ch) {
  return ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0;
}

// Recursive-descent validator. Each function returns the position just past the
// value it consumed, or npos on a structural error.
class Validator {
public:
  explicit Validator(const std::string &text) : text_(text) {}

  std::size_t value(std::size_t pos, const std::size_t depth) {
    if (depth > kMaxValidationDepth) {
      return std::string::npos;
    }
    pos = json_skip_ws(text_, pos);
    if (pos >= text_.size()) {
      return std::string::npos;
    }
    switch (text_[pos]) {
    case '{':
      return object(pos, depth);
    case '[':
      return array(pos, depth);
    case '"':
      return string(pos);
    case 't':
      return literal(pos, "true");
    case 'f':
      return literal(pos, "false");
    case 'n':
      return literal(pos, "null");
    default:
      return number(pos);
    }
  }

private:
  std::size_t object(std::size_t pos, const std::size_t depth) {
    pos = json_skip_ws(text_, pos + 1);
    if (pos < text_.size() && text_[pos] == '}') {
      return pos + 1;
    }
    while (pos < text_.size()) {
      if (text_[pos] != '"') {
        return std::string::npos;
      }
      pos = string(pos);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size() || text_[pos] != ':') {
        return std::string::npos;
      }
      pos = value(pos + 1, depth + 1);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return std::string::npos;
      }
      if (text_[pos] == '}') {
        return pos + 1;
      }
      if (text_[pos] != ',') {
        return std::string::npos;
      }
      pos = json_skip_ws(text_, pos + 1);
    }
    return std::string::npos;
  }

  std::size_t array(std::size_t pos, const std::size_t depth) {
    pos = json_skip_ws(text_, pos + 1);
    if (pos < text_.size() && text_[pos] == ']') {
      return pos + 1;
    }
    while (pos < text_.size()) {
      pos = value(pos, depth + 1);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return std::string::npos;
      }
      if (text_[pos] == ']') {
        return pos + 1;
      }
      if (text_[pos] != ',') {
        return std::string::npos;
      }
      ++pos;
    }
    return std::string::npos;
  }

  std::size_t string(const std::size_t pos) {
    for (std::size_t i = pos + 1; i < text_.size(); ++i) {
      const auto ch = static_cast<unsigned char>(text_[i]);
      if (ch == '"') {
        return i + 1;
      }
      if (ch < 0x20) {
        return std::string::npos;
      }
      if (ch == '\\') {
        ++i;
        if (i >= text_.size()) {
          return std::string::npos;
        }
        const char esc = text_[i];
        if (esc == 'u') {
          std::uint32_t unused = 0;
          if (!read_hex4(text_, i + 1, unused)) {
            return std::string::npos;
          }
          i += 4;
        } else if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' &&
                   esc != 'n' && esc != 'r' && esc != 't') {
          return std::string::npos;
        }
      }
    }
    return std::string::npos;
  }

  std::size_t literal(const std::size_t pos, const std::string &word) {
    if (text_.compare(pos, word.size(), word) != 0) {
      return std::string::npos;
    }
    const std::size_t end = pos + word.size();
    if (end < text_.size() && !is_value_terminator(text_[end])) {
      return std::string::npos;
    }
    return end;
  }

  std::size_t number(std::size_t pos) {
    const std::size_t start = pos;
    if (pos < text_.size() && text_[pos] == '-') {
      ++pos;
    }
    const std::size_t int_start = pos;
    while (pos < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos])) != 0) {
      ++pos;
    }
    if (pos == int_start) {
      return std::string::npos;
    }
    if (pos < text_.size() && text_[pos] == '.') {
      const std::size_t frac_start = ++pos;
      while (pos < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos])) != 0) {
        ++pos;
      }
      if (pos == frac_start) {
        return std::string::npos;
      }
    }
    if (pos < text_.size() && (text_[pos] == 'e' || text_[pos] == 'E')) {
      ++pos;
      if (pos < text_.size() && (text_[pos] == '+' || text_[pos] == '-')) {
        ++pos;
      }
      const std::size_t exp_start = pos;
      while (pos < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos])) != 0) {
        ++pos;
      }
      if (pos == exp_start) {
        return std::string::npos;
      }
    }
    if (pos < text_.size() && !is_value_terminator(text_[pos])) {
      return std::string::npos;
    }
    return pos > start ? pos : std::string::npos;
  }

  const std::string &text_;
};

// Scans one value starting at pos (whitespace already skipped). Returns the
// position just past it, or npos when the value cannot be delimited.
std::size_t scan_value(const std::string &json, const std::size_t pos, JsonField &out) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    if (end == std::string::npos) {
      return end;
    }
    out.type = JsonType::String;
    out.value = json_unescape(json.substr(pos + 1, end - pos - 1));
    return end + 1;
  }
  if (ch == '{' || ch == '[') {
    const char close = ch == '{' ? '}' : ']';
    const auto end = json_find_matching_token(json, pos, ch, close);
    if (end == std::string::npos) {
      return end;
    }
    out.type = ch == '{' ? JsonType::Object : JsonType::Array;
    out.value = json.substr(pos, end - pos + 1);
    return end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && !is_value_terminator(json[end])) {
    ++end;
  }
  if (end == pos) {
    return std::string::npos;
  }
  out.value = json.substr(pos, end - pos);
  if (out.value == "true" || out.value == "false") {
    out.type = JsonType::Bool;
  } else if (out.value == "null") {
    out.type = JsonType::Null;
  } else {
    out.type = JsonType::Number;
  }
  return end;
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
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

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
      std::uint32_t cp = 0;
      if (!read_hex4(raw, i + 1, cp)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (read_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        }
      }
      if (cp >= 0xD800 && cp <= 0xDFFF) {
        cp = 0xFFFD;
      }
      append_utf8(out, cp);
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

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_is_valid(const std::string &json) {
  Validator validator(json);
  const std::size_t end = validator.value(0, 0);
  if (end == std::string::npos) {
    return false;
  }
  return json_skip_ws(json, end) == json.size();
}

JsonFieldMap json_parse_object(const std::string &object_json) {
  JsonFieldMap result;
  std::size_t pos = json_skip_ws(object_json, 0);
  if (pos >= object_json.size() || object_json[pos] != '{') {
    return result;
  }

  ++pos;
  while (pos < object_json.size()) {
    pos = json_skip_ws(object_json, pos);
    if (pos >= object_json.size() || object_json[pos] == '}') {
      break;
    }
    if (object_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (object_json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(object_json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    std::string key = json_unescape(object_json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(object_json, key_end + 1);
    if (pos >= object_json.size() || object_json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(object_json, pos + 1);

    JsonField field;
    const auto end = scan_value(object_json, pos, field);
    if (end == std::string::npos) {
      break;
    }
    result.emplace(std::move(key), std::move(field));
    pos = end;
  }
  return result;
}

std::vector<JsonField> json_split_array(const std::string &array_json) {
  std::vector<JsonField> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }

  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    JsonField field;
    const auto end = scan_value(array_json, pos, field);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(std::move(field));
    pos = end;
  }
  return out;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  for (auto &[key, field] : json_parse_object(json)) {
    result.emplace(key, std::move(field.value));
  }
  return result;
}

std::string json_field_string(const JsonFieldMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || !it->second.is_string()) {
    return "";
  }
  return it->second.value;
}

bool json_field_true(const JsonFieldMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  return it != fields.end() && it->second.is_true();
}

std::uint64_t json_field_u64(const JsonFieldMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.type != JsonType::Number) {
    return 0;
  }
  const std::string &raw = it->second.value;
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc()) {
    return 0;
  }
  (void)ptr;
  return parsed;
}

} // namespace tracescope::common
