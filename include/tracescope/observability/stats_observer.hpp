#pragma once

#include "tracescope/observability/observer.hpp"

#include <cstdint>
#include <mutex>
#include <ostream>

namespace tracescope::observability {

struct ScanTally {
  std::uint64_t parsed = 0;
  std::uint64_t skipped = 0;
  std::uint64_t errors = 0;
  std::uint64_t conversations = 0;
  std::uint64_t skipped_lines = 0;
  std::uint64_t cache_hits = 0;
  std::uint64_t searches = 0;
};

/// Counts loader and search activity, and prints one summary line per flush.
class StatsObserver final : public IObserver {
public:
  explicit StatsObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "stats"; }

  [[nodiscard]] ScanTally tally() const;

private:
  std::ostream &out_;
  mutable std::mutex mutex_;
  ScanTally tally_;
};

} // namespace tracescope::observability
