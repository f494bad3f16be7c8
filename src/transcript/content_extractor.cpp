#include "tracescope/transcript/content_extractor.hpp"

#include "tracescope/common/fs.hpp"
#include "tracescope/transcript/text_heuristics.hpp"

#include <type_traits>

namespace tracescope::transcript {

std::vector<ToolInvocation> extract_tool_uses(const Entry &entry) {
  std::vector<ToolInvocation> tools;
  for (const auto &item : entry.items) {
    if (const auto *tool = std::get_if<ToolUseItem>(&item); tool != nullptr) {
      tools.push_back(ToolInvocation{
          .timestamp = entry.timestamp,
          .name = tool->name.empty() ? "unknown" : tool->name,
          .id = tool->id.empty() ? "unknown" : tool->id,
          .input = tool->input,
      });
    }
  }
  return tools;
}

std::vector<ToolResult> extract_tool_results(const Entry &entry) {
  std::vector<ToolResult> results;
  for (const auto &item : entry.items) {
    if (const auto *result = std::get_if<ToolResultItem>(&item);
        result != nullptr && !result->tool_use_id.empty()) {
      results.push_back(ToolResult{
          .tool_id = result->tool_use_id,
          .result = result->content,
          .is_error = result->is_error,
      });
    }
  }
  return results;
}

TokenUsage extract_token_usage(const Entry &entry) { return entry.usage.value_or(TokenUsage{}); }

ThinkingExtraction extract_thinking(const Entry &entry) {
  ThinkingExtraction extraction;
  for (const auto &item : entry.items) {
    if (const auto *thinking = std::get_if<ThinkingItem>(&item);
        thinking != nullptr && !thinking->thinking.empty()) {
      extraction.char_count += common::utf8_length(thinking->thinking);
      extraction.blocks.push_back(
          ThinkingBlock{.timestamp = entry.timestamp, .text = thinking->thinking});
    }
  }
  return extraction;
}

bool has_actual_content(const Entry &entry) {
  if (entry.content_string.has_value()) {
    return !common::trim(*entry.content_string).empty();
  }
  for (const auto &item : entry.items) {
    const bool actual = std::visit(
        [](const auto &value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, TextItem>) {
            return !common::trim(value.text).empty();
          } else if constexpr (std::is_same_v<T, ThinkingItem>) {
            return !value.thinking.empty();
          } else if constexpr (std::is_same_v<T, ToolUseItem>) {
            return true;
          } else {
            return false;
          }
        },
        item);
    if (actual) {
      return true;
    }
  }
  return false;
}

std::string user_text(const Entry &entry) {
  if (entry.content_string.has_value()) {
    return *entry.content_string;
  }
  std::string text;
  for (const auto &item : entry.items) {
    if (const auto *value = std::get_if<TextItem>(&item); value != nullptr) {
      text += value->text;
    }
  }
  return text;
}

std::string extract_user_content(const Entry &entry) {
  if (!entry.has_content) {
    return NO_CONTENT;
  }
  return heuristics::clean_user_text(user_text(entry));
}

std::string extract_assistant_content(const Entry &entry) {
  if (!entry.has_content) {
    return NO_CONTENT;
  }
  return common::trim(user_text(entry));
}

bool is_tool_result_notification(const Entry &entry) {
  if (entry.content_string.has_value()) {
    const auto &text = *entry.content_string;
    return text.find("tool_use_id") != std::string::npos ||
           text.find("tool_result") != std::string::npos;
  }
  for (const auto &item : entry.items) {
    if (std::holds_alternative<ToolResultItem>(item)) {
      return true;
    }
  }
  return false;
}

bool has_only_text(const Entry &entry) {
  if (entry.content_string.has_value() || entry.items.empty()) {
    return false;
  }
  for (const auto &item : entry.items) {
    if (!std::holds_alternative<TextItem>(item)) {
      return false;
    }
  }
  return true;
}

bool invokes_tool(const Entry &entry, const std::string &tool_name) {
  for (const auto &item : entry.items) {
    if (const auto *tool = std::get_if<ToolUseItem>(&item);
        tool != nullptr && tool->name == tool_name) {
      return true;
    }
  }
  return false;
}

} // namespace tracescope::transcript
