#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace gate::db::model {

/*
  One accepted submission.

  IMPORTANT:
  - Immutable once written; the gate never updates or deletes ledger rows.
  - id is a fresh v4 UUID per commit attempt.
*/

struct LedgerRecord {
  std::string id;

  std::string task_id;
  int64_t     miner_id    = 0;
  double      performance = 0.0;

  // opaque JSON text
  //   postgres -> jsonb
  //   sqlite   -> text
  std::string hyperparameters_json;

  std::string artifact_hash;

  // absolute time the miner claims to have submitted at
  util::TimePoint submitted_at{};
};

} // namespace gate::db::model
