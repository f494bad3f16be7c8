#include "tracescope/sessions/cache.hpp"

namespace tracescope::sessions {

std::optional<SessionPtr> SessionCache::lookup(const std::filesystem::path &path,
                                               const std::filesystem::file_time_type mtime) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = slots_.find(path.string());
  if (it == slots_.end()) {
    ++misses_;
    return std::nullopt;
  }
  if (it->second.mtime != mtime) {
    slots_.erase(it);
    ++misses_;
    return std::nullopt;
  }
  ++hits_;
  return it->second.session;
}

void SessionCache::store(const std::filesystem::path &path,
                         const std::filesystem::file_time_type mtime, SessionPtr session) {
  std::lock_guard<std::mutex> lock(mutex_);
  slots_[path.string()] = Slot{.mtime = mtime, .session = std::move(session)};
}

void SessionCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  slots_.clear();
  hits_ = 0;
  misses_ = 0;
}

std::size_t SessionCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_.size();
}

std::size_t SessionCache::hits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hits_;
}

std::size_t SessionCache::misses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return misses_;
}

} // namespace tracescope::sessions
