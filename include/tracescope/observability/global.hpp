#pragma once

#include "tracescope/observability/observer.hpp"

#include <memory>

namespace tracescope::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_session_parsed(const std::string &file, std::uint64_t conversations,
                           std::chrono::milliseconds duration);
void record_session_skipped(const std::string &file, const std::string &reason);
void record_scan_complete(std::uint64_t files, std::uint64_t sessions,
                          std::chrono::milliseconds duration);
void record_search(const std::string &query, std::uint64_t results, bool regex);
void record_error(const std::string &component, const std::string &message);

} // namespace tracescope::observability
