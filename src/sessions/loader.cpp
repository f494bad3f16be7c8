#include "tracescope/sessions/loader.hpp"

#include "tracescope/common/fs.hpp"
#include "tracescope/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

namespace tracescope::sessions {

namespace {

struct Outcome {
  SessionPtr session;
  bool failed = false;
  bool cache_hit = false;
  std::size_t skipped_lines = 0;
};

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

void WorkQueue::push(WorkItem item) {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.push(std::move(item));
}

std::optional<WorkItem> WorkQueue::pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto value = std::move(queue_.front());
  queue_.pop();
  return value;
}

std::size_t WorkQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool WorkQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

LoadOptions load_options(const config::Config &config) {
  LoadOptions options;
  options.workers = config.parser.workers;
  options.memoize = config.parser.memoize;
  options.decode.streaming_threshold_bytes = config.parser.streaming_threshold_bytes;
  options.decode.tool_result_max_chars = config.parser.tool_result_max_chars;
  return options;
}

SessionLoader::SessionLoader(LoadOptions options, SessionCache *cache)
    : options_(std::move(options)), cache_(cache), ingestor_(options_.decode) {
  options_.workers = std::clamp<std::size_t>(options_.workers, 1, MAX_WORKERS);
}

common::Result<SessionPtr> SessionLoader::load_file(const std::filesystem::path &path,
                                                    std::size_t *skipped_lines,
                                                    bool *cache_hit) const {
  const auto start = std::chrono::steady_clock::now();

  std::optional<std::filesystem::file_time_type> mtime;
  if (cache_ != nullptr && options_.memoize) {
    auto stat = common::file_mtime(path);
    if (!stat.ok()) {
      return common::Result<SessionPtr>::failure(stat.error());
    }
    mtime = stat.value();
    if (auto cached = cache_->lookup(path, *mtime); cached.has_value()) {
      if (cache_hit != nullptr) {
        *cache_hit = true;
      }
      return common::Result<SessionPtr>::success(*cached);
    }
  }

  auto decoded = ingestor_.decode_file(path);
  if (!decoded.ok()) {
    return common::Result<SessionPtr>::failure(decoded.error());
  }
  if (skipped_lines != nullptr) {
    *skipped_lines = decoded.value().skipped_lines;
  }
  observability::record_metric(observability::SkippedLinesMetric{
      .file = path.string(), .lines = decoded.value().skipped_lines});

  SessionPtr session;
  if (auto built = reconstruct_session(path, decoded.value()); built.has_value()) {
    session = std::make_shared<const Session>(std::move(*built));
  }

  if (mtime.has_value()) {
    cache_->store(path, *mtime, session);
  }

  const auto duration = elapsed_since(start);
  observability::record_metric(observability::ParseLatencyMetric{.latency = duration});
  if (session) {
    observability::record_session_parsed(path.string(), session->pairs.size(), duration);
  } else {
    observability::record_session_skipped(path.string(), "no conversations");
  }
  return common::Result<SessionPtr>::success(session);
}

LoadReport SessionLoader::load(const std::vector<std::filesystem::path> &files) const {
  const auto start = std::chrono::steady_clock::now();

  WorkQueue queue;
  for (std::size_t i = 0; i < files.size(); ++i) {
    queue.push(WorkItem{.index = i, .path = files[i]});
  }
  observability::record_metric(observability::QueueDepthMetric{.depth = queue.size()});

  std::vector<Outcome> outcomes(files.size());
  const auto worker = [&]() {
    while (auto item = queue.pop()) {
      Outcome &outcome = outcomes[item->index];
      try {
        auto loaded = load_file(item->path, &outcome.skipped_lines, &outcome.cache_hit);
        if (!loaded.ok()) {
          outcome.failed = true;
          observability::record_error("loader", loaded.error());
          continue;
        }
        outcome.session = loaded.value();
      } catch (const std::exception &e) {
        outcome.failed = true;
        observability::record_error("loader", item->path.string() + ": " + e.what());
      }
    }
  };

  const std::size_t thread_count = std::min(options_.workers, files.size());
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    threads.emplace_back(worker);
  }
  for (auto &thread : threads) {
    thread.join();
  }

  LoadReport report;
  report.files = files.size();
  for (auto &outcome : outcomes) {
    report.skipped_lines += outcome.skipped_lines;
    if (outcome.cache_hit) {
      ++report.cache_hits;
    }
    if (outcome.failed) {
      ++report.failed;
    } else if (!outcome.session) {
      ++report.empty;
    } else {
      report.sessions.push_back(std::move(outcome.session));
    }
  }

  if (cache_ != nullptr) {
    observability::record_metric(
        observability::CacheHitMetric{.hits = cache_->hits(), .misses = cache_->misses()});
  }
  observability::record_scan_complete(report.files, report.sessions.size(),
                                      elapsed_since(start));
  return report;
}

} // namespace tracescope::sessions
