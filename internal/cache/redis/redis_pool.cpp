#include "redis_pool.hpp"

#include <sys/time.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace gate::cache::redis {

namespace {

timeval ToTimeval(std::chrono::milliseconds ms) {
  timeval tv{};
  tv.tv_sec  = static_cast<time_t>(ms.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
  return tv;
}

int ParseInt(const std::string& text, const char* what) {
  try {
    size_t used  = 0;
    int    value = std::stoi(text, &used);
    if (used != text.size()) throw std::invalid_argument(text);
    return value;
  } catch (const std::exception&) {
    throw util::InvalidArgument(std::string("redis url: bad ") + what + ": " + text);
  }
}

} // namespace

RedisEndpoint RedisEndpoint::Parse(const std::string& url) {
  const std::string scheme = "redis://";
  if (url.rfind(scheme, 0) != 0) {
    throw util::InvalidArgument("redis url must start with redis://: " + url);
  }

  RedisEndpoint ep;
  std::string   rest = url.substr(scheme.size());

  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    const std::string db = rest.substr(slash + 1);
    if (!db.empty()) ep.db = ParseInt(db, "db");
    rest = rest.substr(0, slash);
  }

  auto at = rest.rfind('@');
  if (at != std::string::npos) {
    const std::string userinfo = rest.substr(0, at);
    rest                       = rest.substr(at + 1);

    auto colon = userinfo.find(':');
    if (colon == std::string::npos) {
      ep.password = userinfo;
    } else {
      ep.username = userinfo.substr(0, colon);
      ep.password = userinfo.substr(colon + 1);
    }
  }

  auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    ep.port = ParseInt(rest.substr(colon + 1), "port");
    rest    = rest.substr(0, colon);
  }
  if (!rest.empty()) ep.host = rest;

  return ep;
}

RedisReplyPtr Command(redisContext* ctx, const std::vector<std::string>& argv) {
  std::vector<const char*> args;
  std::vector<size_t>      lens;
  args.reserve(argv.size());
  lens.reserve(argv.size());
  for (const auto& a : argv) {
    args.push_back(a.data());
    lens.push_back(a.size());
  }

  auto* raw = static_cast<redisReply*>(redisCommandArgv(ctx, static_cast<int>(args.size()), args.data(), lens.data()));
  if (!raw) {
    throw util::Unavailable(std::string("redis ") + argv.front() + ": " + (ctx->err ? ctx->errstr : "no reply"));
  }

  RedisReplyPtr reply(raw);
  if (reply->type == REDIS_REPLY_ERROR) {
    throw util::Unavailable(std::string("redis ") + argv.front() + ": " + std::string(reply->str, reply->len));
  }
  return reply;
}

RedisPool::RedisPool(RedisEndpoint endpoint, std::size_t max_connections, std::chrono::milliseconds connect_timeout,
                     std::chrono::milliseconds command_timeout)
    : endpoint_(std::move(endpoint)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      connect_timeout_(connect_timeout),
      command_timeout_(command_timeout) {
}

RedisContextPtr RedisPool::Connect() const {
  RedisContextPtr ctx(redisConnectWithTimeout(endpoint_.host.c_str(), endpoint_.port, ToTimeval(connect_timeout_)));
  if (!ctx) {
    throw util::Unavailable("redis connect: allocation failed");
  }
  if (ctx->err) {
    throw util::Unavailable("redis connect " + endpoint_.host + ":" + std::to_string(endpoint_.port) + ": " + ctx->errstr);
  }

  if (redisSetTimeout(ctx.get(), ToTimeval(command_timeout_)) != REDIS_OK) {
    throw util::Unavailable("redis set timeout failed");
  }

  if (!endpoint_.password.empty()) {
    if (endpoint_.username.empty()) {
      Command(ctx.get(), {"AUTH", endpoint_.password});
    } else {
      Command(ctx.get(), {"AUTH", endpoint_.username, endpoint_.password});
    }
  }
  if (endpoint_.db != 0) {
    Command(ctx.get(), {"SELECT", std::to_string(endpoint_.db)});
  }
  return ctx;
}

std::shared_ptr<redisContext> RedisPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto ctx = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(ctx.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    return Wrap(Connect().release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

std::shared_ptr<redisContext> RedisPool::Wrap(redisContext* ctx) {
  std::weak_ptr<RedisPool> weak_self = shared_from_this();
  return std::shared_ptr<redisContext>(ctx, [weak_self](redisContext* released) {
    if (auto self = weak_self.lock()) {
      self->Release(released);
      return;
    }
    redisFree(released);
  });
}

void RedisPool::Release(redisContext* ctx) {
  {
    std::lock_guard lock(mutex_);
    if (ctx->err) {
      redisFree(ctx);
      --live_connections_;
    } else {
      idle_.emplace_back(ctx);
    }
  }
  cv_.notify_one();
}

} // namespace gate::cache::redis
