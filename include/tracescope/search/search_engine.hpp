#pragma once

#include "tracescope/sessions/session.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace tracescope::search {

inline constexpr std::size_t CONTEXT_RADIUS = 50;

struct SearchOptions {
  bool regex = false;
  bool case_sensitive = false;
  /// 0 means unlimited.
  std::size_t max_results = 0;
  bool thinking_only = false;
};

enum class MatchType { User, Assistant, Thinking };

[[nodiscard]] std::string_view match_type_name(MatchType type);

struct SearchResult {
  std::string session_id;
  std::string project_name;
  std::size_t session_index = 0;
  std::size_t conversation_index = 0;
  MatchType match_type = MatchType::User;
  std::string match_context;
  std::string matched_text;
  common::Timestamp user_time{};
  double response_time_seconds = 0.0;
  std::size_t tool_count = 0;
};

/// Ordered sessions a search walks through.
class SessionSource {
public:
  virtual ~SessionSource() = default;

  [[nodiscard]] virtual std::size_t session_count() const = 0;
  [[nodiscard]] virtual const sessions::Session &session_at(std::size_t index) const = 0;
};

class VectorSessionSource final : public SessionSource {
public:
  explicit VectorSessionSource(const std::vector<sessions::SessionPtr> &sessions);

  [[nodiscard]] std::size_t session_count() const override;
  [[nodiscard]] const sessions::Session &session_at(std::size_t index) const override;

private:
  const std::vector<sessions::SessionPtr> &sessions_;
};

struct TextMatch {
  std::size_t position = 0;
  std::size_t length = 0;
};

/// A compiled query: a case-insensitive regex, or a list of literal terms split on " OR ".
class QueryMatcher {
public:
  /// Returns std::nullopt for an empty query or an invalid regex.
  [[nodiscard]] static std::optional<QueryMatcher> compile(const std::string &query,
                                                           const SearchOptions &options);

  [[nodiscard]] std::optional<TextMatch> find(const std::string &text) const;
  [[nodiscard]] const std::vector<std::string> &terms() const { return terms_; }

private:
  QueryMatcher() = default;

  std::optional<std::regex> regex_;
  std::vector<std::string> terms_;
  bool case_sensitive_ = false;
};

/// Literal terms of a non-regex query, trimmed, empty ones dropped.
[[nodiscard]] std::vector<std::string> split_or_terms(const std::string &query);

/// Field text with continuation preambles and tool artifacts removed, for context display.
[[nodiscard]] std::string searchable_text(const std::string &text);

/// Window of `radius` bytes either side of the match, cut on code point boundaries.
[[nodiscard]] std::string extract_context(const std::string &text, const TextMatch &match,
                                          std::size_t radius = CONTEXT_RADIUS);

class SearchEngine {
public:
  explicit SearchEngine(const SessionSource &source);

  /// Pairs matching `query`, newest user turn first. Each pair reports its first matching
  /// field only. Scanning stops once `max_results` results were gathered.
  [[nodiscard]] std::vector<SearchResult> search(const std::string &query,
                                                 const SearchOptions &options) const;

private:
  const SessionSource &source_;
};

} // namespace tracescope::search
