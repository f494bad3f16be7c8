#include "tracescope/sessions/catalog.hpp"

#include "tracescope/common/fs.hpp"

#include <algorithm>
#include <set>

namespace tracescope::sessions {

namespace {

bool more_recent(const SessionPtr &lhs, const SessionPtr &rhs) {
  return lhs->metrics.last_activity > rhs->metrics.last_activity;
}

} // namespace

SessionCatalog::SessionCatalog(std::vector<SessionPtr> sessions) {
  for (auto &session : sessions) {
    if (session) {
      sessions_.push_back(std::move(session));
    }
  }
  std::stable_sort(sessions_.begin(), sessions_.end(), more_recent);
}

void SessionCatalog::add(SessionPtr session) {
  if (!session) {
    return;
  }
  const auto at = std::upper_bound(sessions_.begin(), sessions_.end(), session, more_recent);
  sessions_.insert(at, std::move(session));
}

const Session &SessionCatalog::session_at(const std::size_t index) const {
  return *sessions_.at(index);
}

std::vector<search::SearchResult>
SessionCatalog::search(const std::string &query, const search::SearchOptions &options) const {
  return search::SearchEngine(*this).search(query, options);
}

DailyStatistics SessionCatalog::daily_statistics() const {
  return sessions::daily_statistics(sessions_);
}

std::vector<ProjectAggregate> SessionCatalog::project_statistics() const {
  return sessions::project_statistics(sessions_);
}

SessionPtr SessionCatalog::find(const std::string &id) const {
  if (id.empty()) {
    return nullptr;
  }
  for (const auto &session : sessions_) {
    if (session->session_id == id || session->full_session_id == id) {
      return session;
    }
  }

  SessionPtr match;
  for (const auto &session : sessions_) {
    if (common::starts_with(session->session_id, id) ||
        common::starts_with(session->full_session_id, id)) {
      if (match && match != session) {
        return nullptr;
      }
      match = session;
    }
  }
  return match;
}

std::vector<std::string> SessionCatalog::projects() const {
  std::set<std::string> names;
  for (const auto &session : sessions_) {
    names.insert(session->project_name);
  }
  return std::vector<std::string>(names.begin(), names.end());
}

CatalogTotals SessionCatalog::totals() const {
  CatalogTotals totals;
  std::set<std::string> ids;
  for (const auto &session : sessions_) {
    ids.insert(session->session_id);
    totals.conversations += session->metrics.conversation_count;
    totals.tools += session->metrics.total_tools;
    totals.duration_seconds += session->metrics.duration_seconds;
    totals.tokens += session->metrics.tokens;
  }
  totals.sessions = ids.size();
  return totals;
}

} // namespace tracescope::sessions
