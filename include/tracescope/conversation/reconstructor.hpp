#pragma once

#include "tracescope/conversation/pair.hpp"
#include "tracescope/transcript/content_extractor.hpp"
#include "tracescope/transcript/entry.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracescope::conversation {

/// The turn currently being assembled. Reset whenever a new user turn starts.
struct TurnState {
  std::optional<transcript::Entry> user;
  std::optional<transcript::Entry> last_response;
  std::size_t response_count = 0;
  std::vector<transcript::ToolInvocation> tool_uses;
  std::unordered_map<std::string, transcript::ToolResult> tool_results;
  std::vector<ThinkingBlock> thinking_blocks;
  std::size_t thinking_char_count = 0;
  std::vector<TimedContentItem> raw_content;
  std::vector<SubAgentThread> sub_agent_threads;
  TokenUsage token_usage;

  [[nodiscard]] bool open() const { return user.has_value(); }
  [[nodiscard]] bool closable() const { return user.has_value() && response_count > 0; }
};

/// Single-pass fold from decoded entries to conversation pairs. Feed entries in file order
/// with consume(), then call finish() once. The fold reads no clock, so the same entries
/// always give the same pairs.
class ConversationReconstructor {
public:
  void consume(const transcript::Entry &entry);
  [[nodiscard]] std::vector<ConversationPair> finish();

  [[nodiscard]] const TurnState &state() const { return turn_; }
  [[nodiscard]] bool pending_task() const { return pending_task_; }
  [[nodiscard]] std::size_t emitted() const { return pairs_.size(); }

  [[nodiscard]] static std::vector<ConversationPair>
  reconstruct(const std::vector<transcript::Entry> &entries);

private:
  void on_user(const transcript::Entry &entry);
  void on_assistant(const transcript::Entry &entry);

  void start_turn(const transcript::Entry &entry);
  void close_turn();
  void add_sub_agent_command(const transcript::Entry &entry);
  void attach_sub_agent_response(const transcript::Entry &entry);
  [[nodiscard]] bool is_sub_agent_command(const transcript::Entry &entry) const;

  TurnState turn_;
  bool pending_task_ = false;
  std::vector<ConversationPair> pairs_;
};

/// Sub-agent reply text that marks the delegated task as finished.
[[nodiscard]] bool is_completion_text(const std::string &text);
[[nodiscard]] bool is_summary_text(const std::string &text);

} // namespace tracescope::conversation
