#include "memory_replay_store.hpp"

#include "internal/util/errors.hpp"

namespace gate::cache::memory {

MemoryReplayStore::MemoryReplayStore(std::size_t max_entries, NowFunc now)
    : max_entries_(max_entries), now_(now ? std::move(now) : NowFunc([] { return Clock::now(); })) {
}

bool MemoryReplayStore::Expired(const Deadline& deadline, Clock::time_point now) const {
  return deadline && *deadline <= now;
}

void MemoryReplayStore::PruneLocked(Clock::time_point now) {
  for (auto it = keys_.begin(); it != keys_.end();) {
    if (Expired(it->second, now)) {
      it = keys_.erase(it);
    } else {
      ++it;
    }
  }
}

bool MemoryReplayStore::SetIfAbsent(const std::string& key) {
  const auto       now = now_();
  std::scoped_lock lock(mutex_);

  auto it = keys_.find(key);
  if (it != keys_.end()) {
    if (!Expired(it->second, now)) return false;
    keys_.erase(it);
  }

  if (now >= next_sweep_) {
    PruneLocked(now);
    next_sweep_ = now + kSweepInterval;
  }

  if (max_entries_ > 0 && keys_.size() >= max_entries_) {
    PruneLocked(now);
    if (keys_.size() >= max_entries_) {
      throw util::Unavailable("replay store full: " + std::to_string(keys_.size()) + " live keys");
    }
  }

  keys_.emplace(key, std::nullopt);
  return true;
}

void MemoryReplayStore::Expire(const std::string& key, std::chrono::seconds ttl) {
  const auto       now = now_();
  std::scoped_lock lock(mutex_);

  // EXPIRE on a missing key is a no-op, same as redis
  auto it = keys_.find(key);
  if (it == keys_.end() || Expired(it->second, now)) return;
  it->second = now + ttl;
}

std::size_t MemoryReplayStore::Size() {
  std::scoped_lock lock(mutex_);
  return keys_.size();
}

} // namespace gate::cache::memory
