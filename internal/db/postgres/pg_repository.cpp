#include "pg_repository.hpp"

#include "internal/util/time.hpp"

namespace gate::db::postgres {

namespace {

model::LedgerRecord ReadLedgerRow(const pqxx::row& row) {
  model::LedgerRecord r;
  r.id                   = row[0].c_str();
  r.task_id              = row[1].c_str();
  r.miner_id             = row[2].as<int64_t>();
  r.performance          = row[3].as<double>();
  r.hyperparameters_json = row[4].c_str();
  r.artifact_hash        = row[5].c_str();
  r.submitted_at         = util::FromUnixSeconds(row[6].as<int64_t>());
  return r;
}

model::TaskRecord ReadTaskRow(const pqxx::row& row) {
  model::TaskRecord r;
  r.task_id               = row[0].c_str();
  r.performance_threshold = row[1].as<double>();
  r.validation_data_hash  = row[2].c_str();
  r.created_at_ms         = row[3].as<uint64_t>();
  return r;
}

constexpr const char* kLedgerSelect =
    "SELECT id, task_id, miner_id, performance, hyperparameters::text, artifact_hash, "
    "extract(epoch from timestamp)::bigint FROM ledger";

constexpr const char* kTaskSelect =
    "SELECT task_id, performance_threshold, validation_data_hash, created_at_ms FROM tasks";

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::Unavailable, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::UpsertMiner(Transaction& t, const model::MinerRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_miner", r.miner_id, r.public_key_hex);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MinerRecord> PgRepository::GetMiner(Transaction& t, int64_t miner_id) {
  auto res = TX(t).Work().exec_prepared("get_miner", miner_id);
  if (res.empty()) return std::nullopt;

  model::MinerRecord r;
  r.miner_id       = res[0][0].as<int64_t>();
  r.public_key_hex = res[0][1].c_str();
  return r;
}

Result PgRepository::InsertLedger(Transaction& t, const model::LedgerRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_ledger", r.id, r.task_id, r.miner_id, r.performance, r.hyperparameters_json,
                               r.artifact_hash, util::ToUnixSeconds(r.submitted_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LedgerRecord> PgRepository::GetLedger(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_ledger", id);
  if (res.empty()) return std::nullopt;
  return ReadLedgerRow(res[0]);
}

std::vector<model::LedgerRecord> PgRepository::ListLedger(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kLedgerSelect) + " ORDER BY id;");

  std::vector<model::LedgerRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadLedgerRow(row));
  return out;
}

Result PgRepository::UpsertTask(Transaction& t, const model::TaskRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_task", r.task_id, r.performance_threshold, r.validation_data_hash,
                               static_cast<int64_t>(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, const std::string& task_id) {
  auto res = TX(t).Work().exec_params(std::string(kTaskSelect) + " WHERE task_id=$1;", task_id);
  if (res.empty()) return std::nullopt;
  return ReadTaskRow(res[0]);
}

std::optional<model::TaskRecord> PgRepository::GetCurrentTask(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kTaskSelect) + " ORDER BY created_at_ms DESC, task_id DESC LIMIT 1;");
  if (res.empty()) return std::nullopt;
  return ReadTaskRow(res[0]);
}

} // namespace gate::db::postgres
