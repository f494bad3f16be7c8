#pragma once

#include "tracescope/common/json_util.hpp"
#include "tracescope/common/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tracescope::transcript {

enum class EntryType { User, Assistant };

struct TextItem {
  std::string text;

  bool operator==(const TextItem &) const = default;
};

struct ThinkingItem {
  std::string thinking;

  bool operator==(const ThinkingItem &) const = default;
};

struct ToolUseItem {
  std::string id;
  std::string name;
  common::JsonFlatMap input;

  bool operator==(const ToolUseItem &) const = default;
};

struct ToolResultItem {
  std::string tool_use_id;
  std::string content;
  bool is_error = false;

  bool operator==(const ToolResultItem &) const = default;
};

/// One element of `message.content`. Items of any other shape are dropped at decode time.
using ContentItem = std::variant<TextItem, ThinkingItem, ToolUseItem, ToolResultItem>;

struct TokenUsage {
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  std::uint64_t total_tokens = 0;
  std::uint64_t cache_creation_input_tokens = 0;
  std::uint64_t cache_read_input_tokens = 0;

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    total_tokens += other.total_tokens;
    cache_creation_input_tokens += other.cache_creation_input_tokens;
    cache_read_input_tokens += other.cache_read_input_tokens;
    return *this;
  }

  bool operator==(const TokenUsage &) const = default;
};

/// A decoded transcript record. `content_string` is set when `message.content` was a plain
/// string; `items` holds the typed elements when it was an array (or a single object).
struct Entry {
  EntryType type = EntryType::User;
  common::Timestamp timestamp{};
  bool has_content = false;
  std::optional<std::string> content_string;
  std::vector<ContentItem> items;
  std::optional<TokenUsage> usage;

  std::string uuid;
  std::string parent_uuid;
  std::string session_id;
  std::string cwd;
  std::string project_name;
  bool is_meta = false;
  bool is_sidechain = false;
  bool is_compact_summary = false;

  [[nodiscard]] bool is_user() const { return type == EntryType::User; }
  [[nodiscard]] bool is_assistant() const { return type == EntryType::Assistant; }
};

} // namespace tracescope::transcript
