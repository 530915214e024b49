#pragma once

#include <hiredis/hiredis.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gate::cache::redis {

// redis://[[user]:password@]host[:port][/db]
struct RedisEndpoint {
  std::string host = "127.0.0.1";
  int         port = 6379;
  std::string username;
  std::string password;
  int         db = 0;

  static RedisEndpoint Parse(const std::string& url);
};

struct RedisContextDeleter {
  void operator()(redisContext* ctx) const {
    redisFree(ctx);
  }
};

struct RedisReplyDeleter {
  void operator()(redisReply* reply) const {
    freeReplyObject(reply);
  }
};

using RedisContextPtr = std::unique_ptr<redisContext, RedisContextDeleter>;
using RedisReplyPtr   = std::unique_ptr<redisReply, RedisReplyDeleter>;

/*
  RedisPool

  Same shape as the postgres pool: bounded, lazily connected, one
  connection per caller at a time. hiredis contexts are not thread-safe.
  A connection that saw an I/O error is closed on release instead of
  being returned to the idle list.
*/
class RedisPool : public std::enable_shared_from_this<RedisPool> {
 public:
  RedisPool(RedisEndpoint endpoint, std::size_t max_connections, std::chrono::milliseconds connect_timeout,
            std::chrono::milliseconds command_timeout);

  // Throws util::Unavailable when no connection can be made.
  std::shared_ptr<redisContext> Acquire();

 private:
  RedisContextPtr               Connect() const;
  std::shared_ptr<redisContext> Wrap(redisContext* ctx);
  void                          Release(redisContext* ctx);

  RedisEndpoint             endpoint_;
  std::size_t               max_connections_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds command_timeout_;

  std::mutex                   mutex_;
  std::condition_variable      cv_;
  std::vector<RedisContextPtr> idle_;
  std::size_t                  live_connections_ = 0;
};

// Runs one command; throws util::Unavailable on transport or server error.
RedisReplyPtr Command(redisContext* ctx, const std::vector<std::string>& argv);

} // namespace gate::cache::redis
