#pragma once

#include "tracescope/sessions/session.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tracescope::sessions {

/// Memo of reconstructed sessions keyed by file path and modification time. A null
/// SessionPtr is a cached "no session" answer.
class SessionCache {
public:
  /// Returns the cached value only when `mtime` matches the stored one. A stale entry is
  /// dropped.
  [[nodiscard]] std::optional<SessionPtr> lookup(const std::filesystem::path &path,
                                                 std::filesystem::file_time_type mtime);
  void store(const std::filesystem::path &path, std::filesystem::file_time_type mtime,
             SessionPtr session);
  void clear();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t hits() const;
  [[nodiscard]] std::size_t misses() const;

private:
  struct Slot {
    std::filesystem::file_time_type mtime;
    SessionPtr session;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Slot> slots_;
  std::size_t hits_ = 0;
  std::size_t misses_ = 0;
};

} // namespace tracescope::sessions
