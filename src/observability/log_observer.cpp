#include "tracescope/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace tracescope::observability {

namespace {

const char *level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionParsedEvent>) {
          log_line(LogLevel::Debug, "session.parsed file=" + evt.file +
                                        " conversations=" + std::to_string(evt.conversations) +
                                        " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SessionSkippedEvent>) {
          log_line(LogLevel::Debug, "session.skipped file=" + evt.file + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ScanCompleteEvent>) {
          log_line(LogLevel::Info, "scan.complete files=" + std::to_string(evt.files) +
                                       " sessions=" + std::to_string(evt.sessions) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SearchEvent>) {
          log_line(LogLevel::Debug, "search query=\"" + evt.query + "\" results=" +
                                        std::to_string(evt.results) +
                                        " regex=" + (evt.regex ? std::string("true")
                                                               : std::string("false")));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ParseLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.parse_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CacheHitMetric>) {
          log_line(LogLevel::Debug, "metric.cache hits=" + std::to_string(m.hits) +
                                        " misses=" + std::to_string(m.misses));
        } else if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line(LogLevel::Debug, "metric.queue_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, SkippedLinesMetric>) {
          if (m.lines > 0) {
            log_line(LogLevel::Warn, "metric.skipped_lines file=" + m.file +
                                         " lines=" + std::to_string(m.lines));
          }
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

} // namespace tracescope::observability
