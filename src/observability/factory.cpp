#include "tracescope/observability/factory.hpp"

#include "tracescope/common/fs.hpp"
#include "tracescope/observability/log_observer.hpp"
#include "tracescope/observability/multi_observer.hpp"
#include "tracescope/observability/stats_observer.hpp"

#include <iostream>

namespace tracescope::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend, const bool verbose) {
  if (backend == "log") {
    return std::make_unique<LogObserver>(verbose ? LogLevel::Debug : LogLevel::Info);
  }
  if (backend == "stats") {
    return std::make_unique<StatsObserver>(std::cerr);
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config, const bool verbose) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return create_single(backend, verbose);
  }

  std::vector<std::unique_ptr<IObserver>> children;
  for (const auto &part : common::split(backend, ',')) {
    if (auto child = create_single(common::trim(part), verbose); child != nullptr) {
      children.push_back(std::move(child));
    }
  }
  if (children.empty()) {
    return nullptr;
  }
  if (children.size() == 1) {
    return std::move(children.front());
  }
  return std::make_unique<MultiObserver>(std::move(children));
}

} // namespace tracescope::observability
