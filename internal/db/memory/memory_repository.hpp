#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace gate::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertMiner(Transaction&, const model::MinerRecord&) override;
  std::optional<model::MinerRecord> GetMiner(Transaction&, int64_t miner_id) override;

  Result InsertLedger(Transaction&, const model::LedgerRecord&) override;
  std::optional<model::LedgerRecord> GetLedger(Transaction&, const std::string& id) override;
  std::vector<model::LedgerRecord> ListLedger(Transaction&) override;

  Result UpsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& task_id) override;
  std::optional<model::TaskRecord> GetCurrentTask(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<int64_t, model::MinerRecord>      miners;
    std::map<std::string, model::LedgerRecord>           ledger;
    std::unordered_map<std::string, model::TaskRecord>   tasks;
  };

  std::mutex mutex_;
  State      committed_;
};

}
