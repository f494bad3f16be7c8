#pragma once

#include "tracescope/sessions/session.hpp"

#include <set>
#include <string>
#include <vector>

namespace tracescope::sessions {

inline constexpr std::size_t SUMMARY_MIN_USER_CHARS = 10;
inline constexpr std::size_t SUMMARY_MAX_PAIRS = 5;
inline constexpr std::size_t SUMMARY_MAX_TOPICS = 5;
inline constexpr std::size_t SUMMARY_MAX_DETAILED = 3;

[[nodiscard]] SessionMetrics calculate_metrics(const std::vector<ConversationPair> &pairs);

/// File names and action keywords found in the first meaningful user turns.
[[nodiscard]] std::vector<std::string> extract_topics(const std::string &user_text);

[[nodiscard]] SessionSummary generate_summary(const std::vector<ConversationPair> &pairs);

struct Rollup {
  std::size_t conversation_count = 0;
  double duration_seconds = 0.0;
  std::size_t tool_count = 0;
  TokenUsage tokens;
  std::set<std::string> session_ids;

  [[nodiscard]] std::size_t session_count() const { return session_ids.size(); }
  void add(const Session &session);
};

struct DayAggregate {
  std::string date;
  Rollup totals;
};

struct ProjectAggregate {
  std::string project;
  Rollup totals;
};

struct DailyStatistics {
  std::vector<DayAggregate> days;
  std::size_t total_sessions = 0;
};

/// Sessions grouped by the local date of their first user turn, oldest day first.
[[nodiscard]] DailyStatistics daily_statistics(const std::vector<SessionPtr> &sessions);

/// Sessions grouped by project name, most conversations first.
[[nodiscard]] std::vector<ProjectAggregate>
project_statistics(const std::vector<SessionPtr> &sessions);

} // namespace tracescope::sessions
