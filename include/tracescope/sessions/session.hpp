#pragma once

#include "tracescope/conversation/pair.hpp"
#include "tracescope/transcript/ingestor.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tracescope::sessions {

using conversation::ConversationPair;
using transcript::TokenUsage;

struct SessionSummary {
  std::string short_text;
  std::vector<std::string> detailed;
};

/// Aggregates derived from a session's pairs. Computed once, when the session is built.
struct SessionMetrics {
  /// Sum of the clamped per-turn response times.
  double duration_seconds = 0.0;
  /// Wall clock from the first user turn to the last assistant turn.
  double actual_duration_seconds = 0.0;
  double avg_response_seconds = 0.0;
  std::size_t total_tools = 0;
  std::size_t thinking_chars = 0;
  std::size_t conversation_count = 0;
  TokenUsage tokens;
  common::Timestamp start_time{};
  common::Timestamp end_time{};
  common::Timestamp last_activity{};
};

struct Session {
  std::string session_id;
  std::string full_session_id;
  std::string project_name;
  std::string project_path;
  std::filesystem::path file_path;
  std::vector<ConversationPair> pairs;
  SessionSummary summary;
  SessionMetrics metrics;
};

using SessionPtr = std::shared_ptr<const Session>;

/// Builds a session from decoded entries. Returns std::nullopt when the entries yield no
/// conversation pair.
[[nodiscard]] std::optional<Session> reconstruct_session(const std::filesystem::path &file_path,
                                                         const transcript::DecodeResult &decoded);

} // namespace tracescope::sessions
