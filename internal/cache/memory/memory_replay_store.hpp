#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/cache/replay_store.hpp"

namespace gate::cache::memory {

/*
  In-process replay store for single-instance deployments and tests.

  Expired keys are dropped lazily on access, by a sweep at most once per
  kSweepInterval, and whenever the table reaches max_entries (0 = no cap).
  A full table with nothing to evict fails closed (Unavailable).
*/
class MemoryReplayStore final : public cache::ReplayStore {
 public:
  using Clock   = std::chrono::steady_clock;
  using NowFunc = std::function<Clock::time_point()>;

  explicit MemoryReplayStore(std::size_t max_entries = 0, NowFunc now = {});

  bool SetIfAbsent(const std::string& key) override;
  void Expire(const std::string& key, std::chrono::seconds ttl) override;

  // Entries currently held, including expired ones not yet swept.
  std::size_t Size();

  static constexpr std::chrono::seconds kSweepInterval{60};

 private:
  // nullopt = no expiry set yet
  using Deadline = std::optional<Clock::time_point>;

  bool Expired(const Deadline& deadline, Clock::time_point now) const;
  void PruneLocked(Clock::time_point now);

  std::size_t max_entries_;
  NowFunc     now_;

  std::mutex                                mutex_;
  std::unordered_map<std::string, Deadline> keys_;
  Clock::time_point                         next_sweep_{};
};

} // namespace gate::cache::memory
