#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace gate::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
