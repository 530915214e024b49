#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "internal/cache/replay_store.hpp"
#include "internal/db/api/repository.hpp"

namespace gate::core {

/*
  Everything a SubmissionPipeline needs, handed over once at construction.
  Nothing here changes after start-up.
*/
struct PipelineContext {
  std::shared_ptr<cache::ReplayStore> replay_store;
  std::shared_ptr<db::Repository>     repository;

  std::chrono::seconds max_clock_skew{60};
  std::chrono::seconds max_age{300};
  std::chrono::seconds replay_ttl{300};

  // unix seconds; tests pin it
  std::function<int64_t()> now_unix_sec;
};

} // namespace gate::core
