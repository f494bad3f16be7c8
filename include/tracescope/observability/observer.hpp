#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tracescope::observability {

struct SessionParsedEvent {
  std::string file;
  std::uint64_t conversations = 0;
  std::chrono::milliseconds duration{0};
};

struct SessionSkippedEvent {
  std::string file;
  std::string reason;
};

struct ScanCompleteEvent {
  std::uint64_t files = 0;
  std::uint64_t sessions = 0;
  std::chrono::milliseconds duration{0};
};

struct SearchEvent {
  std::string query;
  std::uint64_t results = 0;
  bool regex = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SessionParsedEvent, SessionSkippedEvent, ScanCompleteEvent,
                                   SearchEvent, ErrorEvent>;

struct ParseLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct CacheHitMetric {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
};

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

struct SkippedLinesMetric {
  std::string file;
  std::uint64_t lines = 0;
};

using ObserverMetric =
    std::variant<ParseLatencyMetric, CacheHitMetric, QueueDepthMetric, SkippedLinesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace tracescope::observability
