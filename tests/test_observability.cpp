#include "test_framework.hpp"

#include "tracescope/observability/factory.hpp"
#include "tracescope/observability/global.hpp"
#include "tracescope/observability/log_observer.hpp"
#include "tracescope/observability/multi_observer.hpp"
#include "tracescope/observability/stats_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <iostream>
#include <memory>
#include <sstream>

namespace {

// Redirects std::cerr into a buffer for the lifetime of the guard.
class CerrCapture {
public:
  CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~CerrCapture() { std::cerr.rdbuf(old_); }

  [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *old_;
};

} // namespace

void register_observability_tests(std::vector<tracescope::tests::TestCase> &tests) {
  using tracescope::tests::require;
  namespace obs = tracescope::observability;
  namespace th = tracescope::testing;

  tests.push_back({"observer_factory_selects_backend", [] {
                     tracescope::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config) == nullptr, "none installs nothing");
                     config.observability.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log,noop";
                     require(obs::create_observer(config)->name() == "log",
                             "a list with one live entry collapses to it");
                     config.observability.backend = "log, stats";
                     require(obs::create_observer(config)->name() == "log+stats",
                             "list -> fan-out named after its children");
                     config.observability.backend = "noop,none";
                     require(obs::create_observer(config) == nullptr, "no live entries");
                   }});

  tests.push_back({"log_observer_respects_level", [] {
                     CerrCapture capture;
                     obs::LogObserver info(obs::LogLevel::Info);
                     info.record_event(obs::SessionParsedEvent{.file = "a.jsonl", .conversations = 3});
                     info.record_event(obs::ErrorEvent{.component = "search", .message = "bad"});
                     info.record_metric(obs::SkippedLinesMetric{.file = "a.jsonl", .lines = 2});
                     info.record_metric(obs::SkippedLinesMetric{.file = "b.jsonl", .lines = 0});
                     const auto text = capture.text();
                     require(text.find("session.parsed") == std::string::npos,
                             "debug line should be filtered");
                     require(text.find("[ERROR] search: bad") != std::string::npos,
                             "error line expected");
                     require(text.find("[WARN] metric.skipped_lines file=a.jsonl lines=2") !=
                                 std::string::npos,
                             "skipped lines warning expected");
                     require(text.find("b.jsonl") == std::string::npos,
                             "zero skipped lines should be silent");
                   }});

  tests.push_back({"log_observer_verbose_emits_debug", [] {
                     CerrCapture capture;
                     obs::LogObserver debug(obs::LogLevel::Debug);
                     debug.record_event(obs::SearchEvent{.query = "auth", .results = 4, .regex = true});
                     require(capture.text().find("search query=\"auth\" results=4 regex=true") !=
                                 std::string::npos,
                             "search debug line expected");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_unique<th::RecordingObserver>();
                     auto second = std::make_unique<th::RecordingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     obs::MultiObserver multi;
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers are dropped");
                     require(multi.name() == "recording+recording", "name joins children");
                     multi.record_metric(obs::QueueDepthMetric{.depth = 5});
                     require(first_ptr->metrics<obs::QueueDepthMetric>().size() == 1,
                             "first observer should receive metric");
                     require(second_ptr->metrics<obs::QueueDepthMetric>()[0].depth == 5,
                             "second observer should receive metric");
                   }});

  tests.push_back({"stats_observer_tallies_and_flushes_summary", [] {
                     std::ostringstream out;
                     obs::StatsObserver stats(out);
                     stats.record_event(obs::SessionParsedEvent{.file = "a.jsonl", .conversations = 3});
                     stats.record_event(obs::SessionParsedEvent{.file = "b.jsonl", .conversations = 2});
                     stats.record_event(obs::SessionSkippedEvent{.file = "c.jsonl", .reason = "empty"});
                     stats.record_event(obs::ErrorEvent{.component = "loader", .message = "boom"});
                     stats.record_metric(obs::SkippedLinesMetric{.file = "a.jsonl", .lines = 4});
                     stats.record_metric(obs::CacheHitMetric{.hits = 1, .misses = 2});
                     stats.record_metric(obs::CacheHitMetric{.hits = 2, .misses = 2});
                     const auto tally = stats.tally();
                     require(tally.parsed == 2 && tally.conversations == 5, "parsed tally");
                     require(tally.skipped == 1 && tally.errors == 1, "skip and error tally");
                     require(tally.skipped_lines == 4, "skipped lines summed");
                     require(tally.cache_hits == 2, "cache hits keep the latest running total");
                     stats.flush();
                     require(out.str() == "[STATS] parsed=2 skipped=1 errors=1 conversations=5 "
                                          "skipped_lines=4 cache_hits=2 searches=0\n",
                             "summary line: " + out.str());
                   }});

  tests.push_back({"global_observer_helpers_record_events", [] {
                     th::ObserverScope scope;
                     obs::record_session_skipped("x.jsonl", "empty");
                     obs::record_scan_complete(3, 2, std::chrono::milliseconds(7));
                     obs::record_error("loader", "boom");
                     const auto skipped = scope.observer().events<obs::SessionSkippedEvent>();
                     require(skipped.size() == 1 && skipped[0].reason == "empty", "skip recorded");
                     const auto scans = scope.observer().events<obs::ScanCompleteEvent>();
                     require(scans.size() == 1 && scans[0].sessions == 2, "scan recorded");
                     require(scope.observer().events<obs::ErrorEvent>()[0].component == "loader",
                             "error recorded");
                   }});

  tests.push_back({"global_observer_absent_is_silent", [] {
                     obs::set_global_observer(nullptr);
                     obs::record_error("nobody", "listening");
                     obs::record_metric(obs::ParseLatencyMetric{});
                     require(obs::get_global_observer() == nullptr, "no observer installed");
                     obs::record_search("q", 0, false);
                     obs::set_global_observer(nullptr);
                   }});
}
