#pragma once

#include <memory>

#include "internal/cache/redis/redis_pool.hpp"
#include "internal/cache/replay_store.hpp"

namespace gate::cache::redis {

class RedisReplayStore final : public cache::ReplayStore {
 public:
  explicit RedisReplayStore(std::shared_ptr<RedisPool> pool);

  bool SetIfAbsent(const std::string& key) override;
  void Expire(const std::string& key, std::chrono::seconds ttl) override;

 private:
  std::shared_ptr<RedisPool> pool_;
};

} // namespace gate::cache::redis
