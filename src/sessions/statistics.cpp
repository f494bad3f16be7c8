#include "tracescope/sessions/statistics.hpp"

#include "tracescope/common/fs.hpp"
#include "tracescope/common/time.hpp"
#include "tracescope/transcript/text_heuristics.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <string_view>
#include <unordered_set>

namespace tracescope::sessions {

namespace {

struct ActionPattern {
  const char *label;
  std::vector<const char *> triggers;
};

// Triggers are matched against lowercased text.
const std::vector<ActionPattern> &action_patterns() {
  static const std::vector<ActionPattern> patterns = {
      {"Fix", {"fix", "修正", "なおして"}},
      {"Implement", {"implement", "実装", "つくって"}},
      {"Refactor", {"refactor", "リファクタ"}},
      {"Debug", {"debug", "デバッグ"}},
      {"Test", {"test", "テスト"}},
      {"Analyze", {"analyze", "分析", "解析"}},
      {"Optimize", {"optimize", "最適化"}},
      {"Update", {"update", "更新", "アップデート"}},
      {"Add", {"add", "追加"}},
      {"Remove", {"remove", "削除"}},
      {"Error", {"error", "エラー"}},
      {"Bug", {"bug", "バグ"}},
      {"Selection", {"選択", "selection"}},
      {"Highlight", {"ハイライト", "highlight"}},
      {"Display", {"表示", "display"}},
      {"View", {"画面", "screen", "view"}},
  };
  return patterns;
}

// Tried in this order after a `[\w-]+.` run; the first prefix match wins.
constexpr std::array<std::string_view, 16> FILE_EXTENSIONS = {
    "js", "ts", "tsx", "jsx", "json", "md", "css", "html",
    "py", "rs", "go", "java", "cpp", "c", "h", "hpp"};

bool is_name_char(const char ch) {
  const auto byte = static_cast<unsigned char>(ch);
  return std::isalnum(byte) != 0 || ch == '_' || ch == '-';
}

// File names such as `main.cpp`, scanned left to right without overlap.
std::vector<std::string> file_names_in(const std::string &lowered) {
  std::vector<std::string> names;
  std::size_t pos = 0;
  while (pos < lowered.size()) {
    if (!is_name_char(lowered[pos])) {
      ++pos;
      continue;
    }
    const std::size_t start = pos;
    while (pos < lowered.size() && is_name_char(lowered[pos])) {
      ++pos;
    }
    if (pos >= lowered.size() || lowered[pos] != '.') {
      continue;
    }
    for (const auto extension : FILE_EXTENSIONS) {
      if (lowered.compare(pos + 1, extension.size(), extension) == 0) {
        pos += 1 + extension.size();
        names.push_back(lowered.substr(start, pos - start));
        break;
      }
    }
  }
  return names;
}

constexpr std::size_t SHORT_SUMMARY_CHARS = 60;
constexpr std::size_t FALLBACK_SUMMARY_CHARS = 50;

} // namespace

namespace heuristics = transcript::heuristics;

SessionMetrics calculate_metrics(const std::vector<ConversationPair> &pairs) {
  SessionMetrics metrics;
  if (pairs.empty()) {
    return metrics;
  }

  for (const auto &pair : pairs) {
    metrics.duration_seconds += pair.response_time_seconds;
    metrics.total_tools += pair.tool_count();
    metrics.thinking_chars += pair.thinking_char_count;
    metrics.tokens += pair.token_usage;
  }
  metrics.conversation_count = pairs.size();
  metrics.avg_response_seconds = metrics.duration_seconds / static_cast<double>(pairs.size());
  metrics.start_time = pairs.front().user_time;
  metrics.end_time = pairs.back().assistant_time;
  metrics.last_activity = metrics.end_time;
  metrics.actual_duration_seconds =
      std::max(0.0, common::seconds_between(metrics.start_time, metrics.end_time));
  return metrics;
}

std::vector<std::string> extract_topics(const std::string &user_text) {
  std::vector<std::string> topics;
  const std::string lowered = common::to_lower(user_text);
  for (auto &name : file_names_in(lowered)) {
    if (std::find(topics.begin(), topics.end(), name) == topics.end()) {
      topics.push_back(std::move(name));
    }
  }
  for (const auto &pattern : action_patterns()) {
    const bool hit = std::any_of(pattern.triggers.begin(), pattern.triggers.end(),
                                 [&lowered](const char *trigger) {
                                   return lowered.find(trigger) != std::string::npos;
                                 });
    if (hit) {
      topics.emplace_back(pattern.label);
    }
  }
  return topics;
}

SessionSummary generate_summary(const std::vector<ConversationPair> &pairs) {
  SessionSummary summary;
  if (pairs.empty()) {
    summary.short_text = "No conversations";
    return summary;
  }

  std::vector<const ConversationPair *> meaningful;
  for (const auto &pair : pairs) {
    if (common::utf8_length(pair.user_content) < SUMMARY_MIN_USER_CHARS) {
      continue;
    }
    meaningful.push_back(&pair);
    if (meaningful.size() >= SUMMARY_MAX_PAIRS) {
      break;
    }
  }

  if (meaningful.empty()) {
    summary.short_text =
        heuristics::smart_truncate(pairs.front().user_content, FALLBACK_SUMMARY_CHARS);
    summary.detailed.push_back(pairs.front().user_content);
    return summary;
  }

  std::vector<std::string> topics;
  std::unordered_set<std::string> seen;
  for (const auto *pair : meaningful) {
    if (summary.detailed.size() < SUMMARY_MAX_DETAILED) {
      summary.detailed.push_back(pair->user_content);
    }
    for (auto &topic : extract_topics(pair->user_content)) {
      if (seen.insert(topic).second) {
        topics.push_back(std::move(topic));
      }
    }
  }

  if (topics.empty()) {
    summary.short_text =
        heuristics::smart_truncate(meaningful.front()->user_content, SHORT_SUMMARY_CHARS);
  } else {
    if (topics.size() > SUMMARY_MAX_TOPICS) {
      topics.resize(SUMMARY_MAX_TOPICS);
    }
    summary.short_text = common::join(topics, " • ");
  }
  return summary;
}

void Rollup::add(const Session &session) {
  conversation_count += session.metrics.conversation_count;
  duration_seconds += session.metrics.duration_seconds;
  tool_count += session.metrics.total_tools;
  tokens += session.metrics.tokens;
  session_ids.insert(session.session_id);
}

DailyStatistics daily_statistics(const std::vector<SessionPtr> &sessions) {
  std::map<std::string, Rollup> by_date;
  std::set<std::string> all_sessions;
  for (const auto &session : sessions) {
    if (!session || session->pairs.empty()) {
      continue;
    }
    by_date[common::local_date_key(session->pairs.front().user_time)].add(*session);
    all_sessions.insert(session->session_id);
  }

  DailyStatistics stats;
  stats.total_sessions = all_sessions.size();
  for (auto &[date, totals] : by_date) {
    stats.days.push_back(DayAggregate{.date = date, .totals = std::move(totals)});
  }
  return stats;
}

std::vector<ProjectAggregate> project_statistics(const std::vector<SessionPtr> &sessions) {
  std::map<std::string, Rollup> by_project;
  for (const auto &session : sessions) {
    if (!session) {
      continue;
    }
    const std::string key = session->project_name.empty() ? "Unknown" : session->project_name;
    by_project[key].add(*session);
  }

  std::vector<ProjectAggregate> out;
  out.reserve(by_project.size());
  for (auto &[project, totals] : by_project) {
    out.push_back(ProjectAggregate{.project = project, .totals = std::move(totals)});
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const ProjectAggregate &lhs, const ProjectAggregate &rhs) {
                     return lhs.totals.conversation_count > rhs.totals.conversation_count;
                   });
  return out;
}

} // namespace tracescope::sessions
