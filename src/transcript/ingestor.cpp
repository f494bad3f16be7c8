#include "tracescope/transcript/ingestor.hpp"

#include "tracescope/common/fs.hpp"

#include <fstream>
#include <initializer_list>

namespace tracescope::transcript {

namespace {

constexpr std::size_t HEAD_LINES_KEPT = 3;

bool is_truthy(const common::JsonField &field) {
  switch (field.type) {
  case common::JsonType::Null:
    return false;
  case common::JsonType::Bool:
    return field.value == "true";
  case common::JsonType::String:
    return !field.value.empty();
  case common::JsonType::Number:
    return field.value != "0";
  default:
    return true;
  }
}

std::string element_text(const common::JsonField &element) {
  if (element.is_string()) {
    return element.value;
  }
  if (!element.is_object()) {
    return element.value;
  }
  const auto fields = common::json_parse_object(element.value);
  if (const auto it = fields.find("text"); it != fields.end() && is_truthy(it->second)) {
    return it->second.value;
  }
  if (const auto it = fields.find("content"); it != fields.end() && is_truthy(it->second)) {
    return it->second.value;
  }
  return element.value;
}

std::string tool_result_text(const common::JsonFieldMap &fields) {
  if (const auto it = fields.find("content"); it != fields.end() && is_truthy(it->second)) {
    const auto &content = it->second;
    if (content.is_array()) {
      std::vector<std::string> parts;
      for (const auto &element : common::json_split_array(content.value)) {
        parts.push_back(element_text(element));
      }
      return common::join(parts, "\n");
    }
    if (content.is_object()) {
      const auto inner = common::json_parse_object(content.value);
      if (const auto text = inner.find("text"); text != inner.end() && is_truthy(text->second)) {
        return text->second.value;
      }
    }
    return content.value;
  }
  if (const auto it = fields.find("text"); it != fields.end() && is_truthy(it->second)) {
    return it->second.value;
  }
  if (const auto it = fields.find("result"); it != fields.end() && is_truthy(it->second)) {
    return it->second.value;
  }
  return "";
}

std::optional<ContentItem> decode_item(const common::JsonField &field, const std::size_t cap) {
  if (field.is_string()) {
    return TextItem{.text = field.value};
  }
  if (!field.is_object()) {
    return std::nullopt;
  }

  const auto fields = common::json_parse_object(field.value);
  const std::string type = common::json_field_string(fields, "type");
  if (type == "text") {
    return TextItem{.text = common::json_field_string(fields, "text")};
  }
  if (type == "thinking") {
    return ThinkingItem{.thinking = common::json_field_string(fields, "thinking")};
  }
  if (type == "tool_use") {
    ToolUseItem item;
    item.id = common::json_field_string(fields, "id");
    item.name = common::json_field_string(fields, "name");
    if (const auto it = fields.find("input"); it != fields.end() && it->second.is_object()) {
      item.input = common::json_parse_flat(it->second.value);
    }
    return item;
  }
  if (type == "tool_result" || fields.contains("tool_use_id")) {
    ToolResultItem item;
    item.tool_use_id = common::json_field_string(fields, "tool_use_id");
    item.content = tool_result_text(fields);
    item.is_error = common::json_field_true(fields, "is_error");
    if (common::utf8_length(item.content) > cap) {
      item.content = common::utf8_prefix(item.content, cap) + TRUNCATION_MARKER;
    }
    return item;
  }
  return std::nullopt;
}

TokenUsage decode_usage(const std::string &usage_json) {
  const auto fields = common::json_parse_object(usage_json);
  TokenUsage usage;
  usage.input_tokens = common::json_field_u64(fields, "input_tokens");
  usage.output_tokens = common::json_field_u64(fields, "output_tokens");
  usage.total_tokens = usage.input_tokens + usage.output_tokens;
  usage.cache_creation_input_tokens =
      common::json_field_u64(fields, "cache_creation_input_tokens");
  usage.cache_read_input_tokens = common::json_field_u64(fields, "cache_read_input_tokens");
  return usage;
}

std::string first_string(const common::JsonFieldMap &fields,
                         std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    if (auto value = common::json_field_string(fields, key); !value.empty()) {
      return value;
    }
  }
  return "";
}

} // namespace

Ingestor::Ingestor(DecodeOptions options) : options_(options) {}

LineOutcome Ingestor::decode_line(const std::string &line, const common::Timestamp fallback_time,
                                  Entry &out) const {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty()) {
    return LineOutcome::Blank;
  }
  if (trimmed.front() != '{' || trimmed.back() != '}') {
    return LineOutcome::Malformed;
  }
  if (trimmed.find("\"type\"") == std::string::npos) {
    return LineOutcome::Ignored;
  }
  if (!common::json_is_valid(trimmed)) {
    return LineOutcome::Malformed;
  }

  const auto fields = common::json_parse_object(trimmed);
  const std::string type = common::json_field_string(fields, "type");
  Entry entry;
  if (type == "user") {
    entry.type = EntryType::User;
  } else if (type == "assistant") {
    entry.type = EntryType::Assistant;
  } else {
    return LineOutcome::Ignored;
  }

  entry.timestamp = fallback_time;
  if (const auto raw = common::json_field_string(fields, "timestamp"); !raw.empty()) {
    if (const auto parsed = common::parse_iso8601(raw); parsed.has_value()) {
      entry.timestamp = *parsed;
    }
  }

  entry.uuid = common::json_field_string(fields, "uuid");
  entry.parent_uuid = common::json_field_string(fields, "parentUuid");
  entry.session_id = first_string(fields, {"session_id", "conversation_id", "sessionId"});
  entry.cwd = common::json_field_string(fields, "cwd");
  entry.project_name = first_string(fields, {"project_name", "project"});
  entry.is_meta = common::json_field_true(fields, "isMeta");
  entry.is_sidechain = common::json_field_true(fields, "isSidechain");
  entry.is_compact_summary = common::json_field_true(fields, "isCompactSummary");

  if (const auto usage = fields.find("usage"); usage != fields.end() && usage->second.is_object()) {
    entry.usage = decode_usage(usage->second.value);
  }

  if (const auto message = fields.find("message");
      message != fields.end() && message->second.is_object()) {
    const auto message_fields = common::json_parse_object(message->second.value);
    if (!entry.usage.has_value()) {
      if (const auto usage = message_fields.find("usage");
          usage != message_fields.end() && usage->second.is_object()) {
        entry.usage = decode_usage(usage->second.value);
      }
    }

    if (const auto content = message_fields.find("content"); content != message_fields.end()) {
      const auto &field = content->second;
      if (field.is_string()) {
        entry.has_content = !field.value.empty();
        entry.content_string = field.value;
      } else if (field.is_array()) {
        entry.has_content = true;
        for (const auto &element : common::json_split_array(field.value)) {
          if (auto item = decode_item(element, options_.tool_result_max_chars); item.has_value()) {
            entry.items.push_back(std::move(*item));
          }
        }
      } else if (field.is_object()) {
        entry.has_content = true;
        if (auto item = decode_item(field, options_.tool_result_max_chars); item.has_value()) {
          entry.items.push_back(std::move(*item));
        }
      }
    }
  }

  out = std::move(entry);
  return LineOutcome::Entry;
}

void Ingestor::consume_line(const std::string &line, const common::Timestamp fallback_time,
                            DecodeResult &result) const {
  ++result.line_count;
  Entry entry;
  switch (decode_line(line, fallback_time, entry)) {
  case LineOutcome::Entry:
    if (result.head_lines.size() < HEAD_LINES_KEPT) {
      result.head_lines.push_back(common::trim(line));
    }
    if (!result.first_entry.has_value()) {
      result.first_entry = entry;
    }
    result.entries.push_back(std::move(entry));
    break;
  case LineOutcome::Malformed:
    ++result.skipped_lines;
    break;
  case LineOutcome::Ignored:
    ++result.ignored_entries;
    break;
  case LineOutcome::Blank:
    break;
  }
}

DecodeResult Ingestor::decode_text(const std::string &text) const {
  DecodeResult result;
  const auto now = std::chrono::system_clock::now();
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    consume_line(text.substr(start, end - start), now, result);
    start = end + 1;
  }
  return result;
}

DecodeResult Ingestor::decode_stream(std::istream &input) const {
  DecodeResult result;
  const auto now = std::chrono::system_clock::now();
  std::string line;
  while (std::getline(input, line)) {
    consume_line(line, now, result);
  }
  return result;
}

common::Result<DecodeResult> Ingestor::decode_file(const std::filesystem::path &path) const {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return common::Result<DecodeResult>::failure("Unable to stat " + path.string() + ": " +
                                                 ec.message());
  }

  if (size > options_.streaming_threshold_bytes) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
      return common::Result<DecodeResult>::failure("Unable to open file: " + path.string());
    }
    auto result = decode_stream(input);
    if (input.bad()) {
      return common::Result<DecodeResult>::failure("Failed reading file: " + path.string());
    }
    return common::Result<DecodeResult>::success(std::move(result));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<DecodeResult>::failure(content.error());
  }
  return common::Result<DecodeResult>::success(decode_text(content.value()));
}

} // namespace tracescope::transcript
