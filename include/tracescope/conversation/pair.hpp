#pragma once

#include "tracescope/transcript/content_extractor.hpp"
#include "tracescope/transcript/entry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tracescope::conversation {

using transcript::ThinkingBlock;
using transcript::TokenUsage;

/// A tool invocation joined with its result by id. `result` stays empty when no result with
/// a matching id was seen during the turn.
struct ToolUse {
  common::Timestamp timestamp{};
  std::string tool_name;
  std::string tool_id;
  common::JsonFlatMap input;
  std::optional<std::string> result;
  bool is_error = false;

  bool operator==(const ToolUse &) const = default;
};

/// An assistant entry's reply as seen from a sub-agent thread.
struct SubAgentResponse {
  common::Timestamp timestamp{};
  std::string content;
  std::vector<std::string> tool_names;

  bool operator==(const SubAgentResponse &) const = default;
};

/// A command delegated to a sub-agent through the Task tool, with its replies in order.
struct SubAgentThread {
  common::Timestamp command_time{};
  std::string command;
  std::string command_uuid;
  std::vector<SubAgentResponse> responses;
  bool complete = false;

  bool operator==(const SubAgentThread &) const = default;
};

/// One content item of the turn, stamped with the time of the assistant entry carrying it.
struct TimedContentItem {
  common::Timestamp timestamp{};
  transcript::ContentItem item;

  bool operator==(const TimedContentItem &) const = default;
};

struct ConversationPair {
  common::Timestamp user_time{};
  common::Timestamp assistant_time{};
  double response_time_seconds = 0.0;

  std::string user_content;
  std::string assistant_content;
  std::string assistant_preview;

  std::vector<ToolUse> tool_uses;
  std::vector<ToolUse> all_tool_uses;
  std::vector<ThinkingBlock> thinking_blocks;
  std::size_t thinking_char_count = 0;
  TokenUsage token_usage;

  std::string session_id;
  std::string user_uuid;
  std::string user_parent_uuid;
  std::string assistant_uuid;
  std::string assistant_parent_uuid;
  bool is_meta = false;
  bool is_sidechain = false;
  bool compact_continuation = false;

  std::vector<SubAgentThread> sub_agent_threads;
  std::vector<TimedContentItem> raw_assistant_content;

  [[nodiscard]] std::size_t tool_count() const { return tool_uses.size(); }

  bool operator==(const ConversationPair &) const = default;
};

/// Maximum response time attributed to a single turn, in seconds.
inline constexpr double MAX_RESPONSE_TIME_SECONDS = 3600.0;

/// Seconds from `user_time` to `assistant_time`, clamped to [0, MAX_RESPONSE_TIME_SECONDS].
[[nodiscard]] double clamp_response_time(common::Timestamp user_time,
                                         common::Timestamp assistant_time);

} // namespace tracescope::conversation
