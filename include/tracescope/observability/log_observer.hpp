#pragma once

#include "tracescope/observability/observer.hpp"

#include <mutex>

namespace tracescope::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Writes `[LEVEL] message` lines to stderr. Lines below `min_level` are dropped.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::mutex mutex_;
};

} // namespace tracescope::observability
