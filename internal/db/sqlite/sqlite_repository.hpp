#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace gate::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
