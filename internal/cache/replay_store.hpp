#pragma once

#include <chrono>
#include <string>

namespace gate::cache {

/*
  Shared key store backing replay suppression.

  Semantics guaranteed for ALL backends:

  - SetIfAbsent is atomic: of N concurrent callers with the same key,
    exactly one sees true
  - A key set without a following Expire never expires
  - Both calls throw util::Unavailable when the store cannot be reached

  Redis: SET key 1 NX / EXPIRE key ttl
  Memory: mutex-guarded map with lazy eviction
*/

class ReplayStore {
 public:
  virtual ~ReplayStore() = default;

  // true if the key was absent and is now set
  virtual bool SetIfAbsent(const std::string& key) = 0;

  virtual void Expire(const std::string& key, std::chrono::seconds ttl) = 0;
};

} // namespace gate::cache
