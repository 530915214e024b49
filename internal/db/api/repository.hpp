#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/ledger_record.hpp"
#include "internal/db/model/miner_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace gate::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Ledger inserts never overwrite: a duplicate id is AlreadyExists
    (or ConstraintViolation), never success

  Reads may throw on backend failure; writes return Result.

  The DB is the source of truth for:
    miner keys
    ledger
    task descriptors
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Miner directory
  // ---------------------------------------------------------------------

  virtual Result UpsertMiner(Transaction&, const model::MinerRecord&) = 0;

  virtual std::optional<model::MinerRecord> GetMiner(Transaction&, int64_t miner_id) = 0;

  // ---------------------------------------------------------------------
  // Ledger (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertLedger(Transaction&, const model::LedgerRecord&) = 0;

  virtual std::optional<model::LedgerRecord> GetLedger(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::LedgerRecord> ListLedger(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  virtual Result UpsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& task_id) = 0;

  // Most recently created task, if any.
  virtual std::optional<model::TaskRecord> GetCurrentTask(Transaction&) = 0;
};

} // namespace gate::db
