#pragma once

#include "tracescope/search/search_engine.hpp"
#include "tracescope/sessions/session.hpp"
#include "tracescope/sessions/statistics.hpp"

#include <string>
#include <vector>

namespace tracescope::sessions {

struct CatalogTotals {
  std::size_t sessions = 0;
  std::size_t conversations = 0;
  std::size_t tools = 0;
  double duration_seconds = 0.0;
  TokenUsage tokens;
};

/// Loaded sessions, most recently active first. Read-only once built.
class SessionCatalog final : public search::SessionSource {
public:
  SessionCatalog() = default;
  explicit SessionCatalog(std::vector<SessionPtr> sessions);

  void add(SessionPtr session);

  [[nodiscard]] std::size_t session_count() const override { return sessions_.size(); }
  [[nodiscard]] const Session &session_at(std::size_t index) const override;
  [[nodiscard]] const std::vector<SessionPtr> &sessions() const { return sessions_; }

  [[nodiscard]] std::vector<search::SearchResult> search(const std::string &query,
                                                         const search::SearchOptions &options) const;
  [[nodiscard]] DailyStatistics daily_statistics() const;
  [[nodiscard]] std::vector<ProjectAggregate> project_statistics() const;

  /// Exact session id or full session id, else a unique prefix of either.
  [[nodiscard]] SessionPtr find(const std::string &id) const;

  /// Distinct project names, sorted.
  [[nodiscard]] std::vector<std::string> projects() const;
  [[nodiscard]] CatalogTotals totals() const;

private:
  std::vector<SessionPtr> sessions_;
};

} // namespace tracescope::sessions
