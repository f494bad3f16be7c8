#include "tracescope/observability/stats_observer.hpp"

#include <type_traits>

namespace tracescope::observability {

StatsObserver::StatsObserver(std::ostream &out) : out_(out) {}

void StatsObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionParsedEvent>) {
          ++tally_.parsed;
          tally_.conversations += evt.conversations;
        } else if constexpr (std::is_same_v<T, SessionSkippedEvent>) {
          ++tally_.skipped;
        } else if constexpr (std::is_same_v<T, SearchEvent>) {
          ++tally_.searches;
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          ++tally_.errors;
        }
      },
      event);
}

void StatsObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto *skipped = std::get_if<SkippedLinesMetric>(&metric); skipped != nullptr) {
    tally_.skipped_lines += skipped->lines;
  } else if (const auto *cache = std::get_if<CacheHitMetric>(&metric); cache != nullptr) {
    // Cache metrics carry running totals for the batch.
    tally_.cache_hits = cache->hits;
  }
}

void StatsObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[STATS] parsed=" << tally_.parsed << " skipped=" << tally_.skipped
       << " errors=" << tally_.errors << " conversations=" << tally_.conversations
       << " skipped_lines=" << tally_.skipped_lines << " cache_hits=" << tally_.cache_hits
       << " searches=" << tally_.searches << "\n";
  out_.flush();
}

ScanTally StatsObserver::tally() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tally_;
}

} // namespace tracescope::observability
