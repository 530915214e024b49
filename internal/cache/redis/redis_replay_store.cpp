#include "redis_replay_store.hpp"

#include "internal/util/errors.hpp"

namespace gate::cache::redis {

RedisReplayStore::RedisReplayStore(std::shared_ptr<RedisPool> pool) : pool_(std::move(pool)) {
}

bool RedisReplayStore::SetIfAbsent(const std::string& key) {
  auto conn  = pool_->Acquire();
  auto reply = Command(conn.get(), {"SET", key, "1", "NX"});

  // +OK when set, nil when the key already existed
  if (reply->type == REDIS_REPLY_NIL) return false;
  if (reply->type == REDIS_REPLY_STATUS) return true;
  throw util::Unavailable("redis SET NX: unexpected reply type " + std::to_string(reply->type));
}

void RedisReplayStore::Expire(const std::string& key, std::chrono::seconds ttl) {
  auto conn = pool_->Acquire();
  Command(conn.get(), {"EXPIRE", key, std::to_string(ttl.count())});
}

} // namespace gate::cache::redis
