#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracescope::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (handles \uXXXX including surrogate pairs).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Strict structural check: `json` holds exactly one well-formed JSON value.
[[nodiscard]] bool json_is_valid(const std::string &json);

enum class JsonType { String, Number, Bool, Null, Object, Array };

/// One scanned value. Strings are unescaped; every other type keeps its raw text.
struct JsonField {
  JsonType type = JsonType::Null;
  std::string value;

  [[nodiscard]] bool is_string() const { return type == JsonType::String; }
  [[nodiscard]] bool is_object() const { return type == JsonType::Object; }
  [[nodiscard]] bool is_array() const { return type == JsonType::Array; }
  [[nodiscard]] bool is_true() const { return type == JsonType::Bool && value == "true"; }
};

using JsonFieldMap = std::unordered_map<std::string, JsonField>;

/// Parse the top-level members of a JSON object. Duplicate keys keep the first value.
[[nodiscard]] JsonFieldMap json_parse_object(const std::string &object_json);

/// Split a JSON array into its top-level elements.
[[nodiscard]] std::vector<JsonField> json_split_array(const std::string &array_json);

/// Parse a flat JSON object into a key→value map (strings unescaped, others raw).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

[[nodiscard]] std::string json_field_string(const JsonFieldMap &fields, const std::string &key);
[[nodiscard]] bool json_field_true(const JsonFieldMap &fields, const std::string &key);
[[nodiscard]] std::uint64_t json_field_u64(const JsonFieldMap &fields, const std::string &key);

} // namespace tracescope::common
