#pragma once

#include "tracescope/transcript/entry.hpp"

#include <string>
#include <vector>

namespace tracescope::transcript {

struct ToolInvocation {
  common::Timestamp timestamp{};
  std::string name;
  std::string id;
  common::JsonFlatMap input;
};

struct ToolResult {
  std::string tool_id;
  std::string result;
  bool is_error = false;
};

struct ThinkingBlock {
  common::Timestamp timestamp{};
  std::string text;

  bool operator==(const ThinkingBlock &) const = default;
};

struct ThinkingExtraction {
  std::size_t char_count = 0;
  std::vector<ThinkingBlock> blocks;
};

inline constexpr const char *NO_CONTENT = "(No content)";
inline constexpr const char *TASK_TOOL = "Task";

/// Tool invocations in item order. Missing names and ids become "unknown".
[[nodiscard]] std::vector<ToolInvocation> extract_tool_uses(const Entry &entry);

/// Tool results carrying a `tool_use_id`.
[[nodiscard]] std::vector<ToolResult> extract_tool_results(const Entry &entry);

[[nodiscard]] TokenUsage extract_token_usage(const Entry &entry);
[[nodiscard]] ThinkingExtraction extract_thinking(const Entry &entry);

/// Non-blank text, any thinking or any tool invocation.
[[nodiscard]] bool has_actual_content(const Entry &entry);

/// Raw user text: the content string, or the concatenated text items.
[[nodiscard]] std::string user_text(const Entry &entry);

/// User text with continuation preambles and tool artifacts removed.
[[nodiscard]] std::string extract_user_content(const Entry &entry);

/// Concatenated text items, trimmed.
[[nodiscard]] std::string extract_assistant_content(const Entry &entry);

/// A user entry that only echoes tool output back to the model.
[[nodiscard]] bool is_tool_result_notification(const Entry &entry);

/// True when every item is text (and there is at least one item).
[[nodiscard]] bool has_only_text(const Entry &entry);

[[nodiscard]] bool invokes_tool(const Entry &entry, const std::string &tool_name);

} // namespace tracescope::transcript
