#pragma once

#include "tracescope/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tracescope::observability {

/// Forwards every event and metric to each child in the order they were added. Named after
/// its children, joined with '+'.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> observers);

  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return name_; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
  std::string name_;
};

} // namespace tracescope::observability
