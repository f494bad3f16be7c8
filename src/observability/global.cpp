#include "tracescope/observability/global.hpp"

#include <mutex>

namespace tracescope::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_session_parsed(const std::string &file, const std::uint64_t conversations,
                           const std::chrono::milliseconds duration) {
  record_event(
      SessionParsedEvent{.file = file, .conversations = conversations, .duration = duration});
}

void record_session_skipped(const std::string &file, const std::string &reason) {
  record_event(SessionSkippedEvent{.file = file, .reason = reason});
}

void record_scan_complete(const std::uint64_t files, const std::uint64_t sessions,
                          const std::chrono::milliseconds duration) {
  record_event(ScanCompleteEvent{.files = files, .sessions = sessions, .duration = duration});
}

void record_search(const std::string &query, const std::uint64_t results, const bool regex) {
  record_event(SearchEvent{.query = query, .results = results, .regex = regex});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace tracescope::observability
