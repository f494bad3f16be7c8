#include "tracescope/conversation/reconstructor.hpp"

#include "tracescope/transcript/text_heuristics.hpp"

#include <algorithm>
#include <array>

namespace tracescope::conversation {

namespace heuristics = transcript::heuristics;

namespace {

constexpr std::array<const char *, 9> COMPLETION_PHRASES = {
    "Task completed successfully",
    "I've completed",
    "I have completed",
    "The task has been completed",
    "All requested",
    "has been successfully",
    "完了しました",
    "タスクを完了",
    "作業を完了",
};

constexpr std::array<const char *, 5> SUMMARY_PHRASES = {"Summary", "In summary", "To summarize",
                                                         "概要", "まとめ"};

constexpr std::size_t PREVIEW_LENGTH = 200;

bool contains_any(const std::string &text, const auto &phrases) {
  return std::any_of(phrases.begin(), phrases.end(), [&text](const char *phrase) {
    return text.find(phrase) != std::string::npos;
  });
}

std::string first_text_item(const transcript::Entry &entry) {
  for (const auto &item : entry.items) {
    if (const auto *text = std::get_if<transcript::TextItem>(&item); text != nullptr) {
      return text->text;
    }
  }
  return "";
}

bool is_compact_continuation(const transcript::Entry &entry, const std::string &user_content) {
  return entry.is_compact_summary || heuristics::is_compact_continuation_text(user_content);
}

} // namespace

bool is_completion_text(const std::string &text) { return contains_any(text, COMPLETION_PHRASES); }

bool is_summary_text(const std::string &text) { return contains_any(text, SUMMARY_PHRASES); }

void ConversationReconstructor::consume(const transcript::Entry &entry) {
  if (entry.is_user()) {
    on_user(entry);
  } else if (entry.is_assistant()) {
    on_assistant(entry);
  }
}

std::vector<ConversationPair> ConversationReconstructor::finish() {
  if (turn_.closable()) {
    close_turn();
  }
  turn_ = TurnState{};
  pending_task_ = false;
  return std::move(pairs_);
}

std::vector<ConversationPair>
ConversationReconstructor::reconstruct(const std::vector<transcript::Entry> &entries) {
  ConversationReconstructor reconstructor;
  for (const auto &entry : entries) {
    reconstructor.consume(entry);
  }
  return reconstructor.finish();
}

void ConversationReconstructor::on_user(const transcript::Entry &entry) {
  if (transcript::is_tool_result_notification(entry)) {
    if (turn_.open()) {
      for (auto &result : transcript::extract_tool_results(entry)) {
        turn_.tool_results[result.tool_id] = std::move(result);
      }
    }
    return;
  }

  if (pending_task_) {
    if (!turn_.open()) {
      start_turn(entry);
    }
    add_sub_agent_command(entry);
    pending_task_ = false;
    return;
  }

  if (is_compact_continuation(entry, transcript::extract_user_content(entry))) {
    start_turn(entry);
    return;
  }

  if (turn_.open() && is_sub_agent_command(entry)) {
    add_sub_agent_command(entry);
    return;
  }
  start_turn(entry);
}

void ConversationReconstructor::on_assistant(const transcript::Entry &entry) {
  if (!turn_.open()) {
    return;
  }
  const std::string &user_session = turn_.user->session_id;
  if (!user_session.empty() && !entry.session_id.empty() && user_session != entry.session_id) {
    turn_ = TurnState{};
    return;
  }

  auto tools = transcript::extract_tool_uses(entry);
  for (const auto &tool : tools) {
    if (tool.name == transcript::TASK_TOOL) {
      pending_task_ = true;
    }
  }
  turn_.tool_uses.insert(turn_.tool_uses.end(), std::make_move_iterator(tools.begin()),
                         std::make_move_iterator(tools.end()));

  for (auto &result : transcript::extract_tool_results(entry)) {
    turn_.tool_results[result.tool_id] = std::move(result);
  }

  auto thinking = transcript::extract_thinking(entry);
  turn_.thinking_char_count += thinking.char_count;
  turn_.thinking_blocks.insert(turn_.thinking_blocks.end(),
                               std::make_move_iterator(thinking.blocks.begin()),
                               std::make_move_iterator(thinking.blocks.end()));
  turn_.token_usage += transcript::extract_token_usage(entry);

  attach_sub_agent_response(entry);

  if (transcript::has_actual_content(entry)) {
    ++turn_.response_count;
    for (const auto &item : entry.items) {
      turn_.raw_content.push_back(TimedContentItem{.timestamp = entry.timestamp, .item = item});
    }
    if (entry.content_string.has_value()) {
      turn_.raw_content.push_back(TimedContentItem{
          .timestamp = entry.timestamp,
          .item = transcript::TextItem{.text = *entry.content_string}});
    }
    turn_.last_response = entry;
  }
}

void ConversationReconstructor::start_turn(const transcript::Entry &entry) {
  if (turn_.closable()) {
    close_turn();
  }
  turn_ = TurnState{};
  turn_.user = entry;
}

void ConversationReconstructor::close_turn() {
  const transcript::Entry &user = *turn_.user;
  const transcript::Entry &anchor = *turn_.last_response;

  ConversationPair pair;
  pair.user_time = user.timestamp;
  pair.assistant_time = anchor.timestamp;
  pair.response_time_seconds = clamp_response_time(user.timestamp, anchor.timestamp);
  pair.user_content = transcript::extract_user_content(user);
  pair.assistant_content = transcript::extract_assistant_content(anchor);
  pair.assistant_preview = heuristics::sanitize_for_display(pair.assistant_content, PREVIEW_LENGTH);

  for (auto &invocation : turn_.tool_uses) {
    ToolUse tool;
    tool.timestamp = invocation.timestamp;
    tool.tool_name = std::move(invocation.name);
    tool.tool_id = std::move(invocation.id);
    tool.input = std::move(invocation.input);
    if (const auto it = turn_.tool_results.find(tool.tool_id); it != turn_.tool_results.end()) {
      tool.result = it->second.result;
      tool.is_error = it->second.is_error;
    }
    if (tool.tool_name != transcript::TASK_TOOL) {
      pair.tool_uses.push_back(tool);
    }
    pair.all_tool_uses.push_back(std::move(tool));
  }

  pair.thinking_blocks = std::move(turn_.thinking_blocks);
  pair.thinking_char_count = turn_.thinking_char_count;
  pair.token_usage = turn_.token_usage;

  pair.session_id = user.session_id;
  pair.user_uuid = user.uuid;
  pair.user_parent_uuid = user.parent_uuid;
  pair.assistant_uuid = anchor.uuid;
  pair.assistant_parent_uuid = anchor.parent_uuid;
  pair.is_meta = user.is_meta;
  pair.is_sidechain = user.is_sidechain;
  pair.compact_continuation = is_compact_continuation(user, pair.user_content);

  pair.sub_agent_threads = std::move(turn_.sub_agent_threads);
  pair.raw_assistant_content = std::move(turn_.raw_content);
  std::stable_sort(pair.raw_assistant_content.begin(), pair.raw_assistant_content.end(),
                   [](const TimedContentItem &lhs, const TimedContentItem &rhs) {
                     return lhs.timestamp < rhs.timestamp;
                   });

  pairs_.push_back(std::move(pair));
}

void ConversationReconstructor::add_sub_agent_command(const transcript::Entry &entry) {
  if (!turn_.sub_agent_threads.empty()) {
    turn_.sub_agent_threads.back().complete = true;
  }
  SubAgentThread thread;
  thread.command_time = entry.timestamp;
  thread.command = transcript::extract_user_content(entry);
  thread.command_uuid = entry.uuid;
  turn_.sub_agent_threads.push_back(std::move(thread));
}

void ConversationReconstructor::attach_sub_agent_response(const transcript::Entry &entry) {
  auto active = std::find_if(turn_.sub_agent_threads.begin(), turn_.sub_agent_threads.end(),
                             [](const SubAgentThread &thread) { return !thread.complete; });
  if (active == turn_.sub_agent_threads.end()) {
    return;
  }

  SubAgentResponse response;
  response.timestamp = entry.timestamp;
  response.content = transcript::extract_assistant_content(entry);
  for (const auto &tool : transcript::extract_tool_uses(entry)) {
    response.tool_names.push_back(tool.name);
  }
  active->responses.push_back(std::move(response));

  if (transcript::has_only_text(entry)) {
    const std::string text = first_text_item(entry);
    if (is_completion_text(text) || (is_summary_text(text) && active->responses.size() >= 2)) {
      active->complete = true;
      pending_task_ = false;
    }
  }

  if (transcript::invokes_tool(entry, transcript::TASK_TOOL)) {
    active->complete = true;
    pending_task_ = true;
  }
}

bool ConversationReconstructor::is_sub_agent_command(const transcript::Entry &entry) const {
  if (turn_.tool_uses.empty()) {
    return false;
  }
  if (turn_.tool_uses.back().name == transcript::TASK_TOOL) {
    return true;
  }
  const std::string content = transcript::extract_user_content(entry);
  return content.find("⎿ task:") != std::string::npos ||
         content.find("task:") != std::string::npos;
}

} // namespace tracescope::conversation
