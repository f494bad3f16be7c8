#pragma once

#include "tracescope/common/result.hpp"
#include "tracescope/config/schema.hpp"
#include "tracescope/sessions/cache.hpp"
#include "tracescope/sessions/session.hpp"
#include "tracescope/transcript/ingestor.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace tracescope::sessions {

inline constexpr std::size_t MAX_WORKERS = 16;

struct WorkItem {
  std::size_t index = 0;
  std::filesystem::path path;
};

/// Files waiting to be parsed. The only state the workers share.
class WorkQueue {
public:
  void push(WorkItem item);
  [[nodiscard]] std::optional<WorkItem> pop();
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool empty() const;

private:
  mutable std::mutex mutex_;
  std::queue<WorkItem> queue_;
};

struct LoadOptions {
  std::size_t workers = 2;
  bool memoize = true;
  transcript::DecodeOptions decode;
};

[[nodiscard]] LoadOptions load_options(const config::Config &config);

struct LoadReport {
  /// One entry per file that produced a session, in input order.
  std::vector<SessionPtr> sessions;
  std::size_t files = 0;
  std::size_t empty = 0;
  std::size_t failed = 0;
  std::size_t cache_hits = 0;
  std::size_t skipped_lines = 0;
};

/// Runs ingest, reconstruction and statistics for a batch of files on a fixed pool of
/// worker threads. A file that fails is reported and dropped; the batch continues.
class SessionLoader {
public:
  explicit SessionLoader(LoadOptions options, SessionCache *cache = nullptr);

  /// Parses one file on the calling thread. A null SessionPtr means the file holds no
  /// conversation.
  [[nodiscard]] common::Result<SessionPtr> load_file(const std::filesystem::path &path,
                                                     std::size_t *skipped_lines = nullptr,
                                                     bool *cache_hit = nullptr) const;

  [[nodiscard]] LoadReport load(const std::vector<std::filesystem::path> &files) const;

  [[nodiscard]] const LoadOptions &options() const { return options_; }

private:
  LoadOptions options_;
  SessionCache *cache_;
  transcript::Ingestor ingestor_;
};

} // namespace tracescope::sessions
