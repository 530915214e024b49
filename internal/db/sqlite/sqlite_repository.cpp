#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace gate::db::sqlite {

using gate::db::ErrorCode;
using gate::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Reads surface backend failures as exceptions; the caller decides the reason.
Stmt PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// true on row, false on done, throws otherwise
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

model::LedgerRecord ReadLedgerRow(sqlite3_stmt* st) {
  model::LedgerRecord r;
  r.id                   = ColText(st, 0);
  r.task_id              = ColText(st, 1);
  r.miner_id             = ColI64(st, 2);
  r.performance          = sqlite3_column_double(st, 3);
  r.hyperparameters_json = ColText(st, 4);
  r.artifact_hash        = ColText(st, 5);

  r.submitted_at         = util::FromIso8601(ColText(st, 6));
  return r;
}

model::TaskRecord ReadTaskRow(sqlite3_stmt* st) {
  model::TaskRecord r;
  r.task_id               = ColText(st, 0);
  r.performance_threshold = sqlite3_column_double(st, 1);
  r.validation_data_hash  = ColText(st, 2);
  r.created_at_ms         = static_cast<uint64_t>(ColI64(st, 3));
  return r;
}

constexpr const char* kLedgerColumns = "id,task_id,miner_id,performance,hyperparameters,artifact_hash,timestamp";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Miners
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMiner(Transaction& t, const model::MinerRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO miners(miner_id,public_key) VALUES(?,?) "
      "ON CONFLICT(miner_id) DO UPDATE SET public_key=excluded.public_key;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) return Translate(db, sqlite3_errcode(db));
  Stmt st(raw);

  BindI64(st.get(), 1, r.miner_id);
  BindText(st.get(), 2, r.public_key_hex);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MinerRecord> SqliteRepository::GetMiner(Transaction& t, int64_t miner_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT miner_id,public_key FROM miners WHERE miner_id=?;");

  BindI64(st.get(), 1, miner_id);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::MinerRecord r;
  r.miner_id       = ColI64(st.get(), 0);
  r.public_key_hex = ColText(st.get(), 1);
  return r;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertLedger(Transaction& t, const model::LedgerRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO ledger(") + kLedgerColumns + ") VALUES(?,?,?,?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) return Translate(db, sqlite3_errcode(db));
  Stmt st(raw);

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.task_id);
  BindI64(st.get(), 3, r.miner_id);
  BindDouble(st.get(), 4, r.performance);
  BindText(st.get(), 5, r.hyperparameters_json);
  BindText(st.get(), 6, r.artifact_hash);
  BindText(st.get(), 7, util::ToIso8601(r.submitted_at));

  int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.id);
  return Translate(db, rc);
}

std::optional<model::LedgerRecord> SqliteRepository::GetLedger(Transaction& t, const std::string& id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kLedgerColumns + " FROM ledger WHERE id=?;";
  auto              st  = PrepareOrThrow(db, sql.c_str());

  BindText(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadLedgerRow(st.get());
}

std::vector<model::LedgerRecord> SqliteRepository::ListLedger(Transaction& t) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kLedgerColumns + " FROM ledger ORDER BY id;";
  auto              st  = PrepareOrThrow(db, sql.c_str());

  std::vector<model::LedgerRecord> out;
  while (StepRow(db, st.get())) out.push_back(ReadLedgerRow(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTask(Transaction& t, const model::TaskRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO tasks(task_id,performance_threshold,validation_data_hash,created_at_ms) VALUES(?,?,?,?) "
      "ON CONFLICT(task_id) DO UPDATE SET performance_threshold=excluded.performance_threshold,"
      "validation_data_hash=excluded.validation_data_hash,created_at_ms=excluded.created_at_ms;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) return Translate(db, sqlite3_errcode(db));
  Stmt st(raw);

  BindText(st.get(), 1, r.task_id);
  BindDouble(st.get(), 2, r.performance_threshold);
  BindText(st.get(), 3, r.validation_data_hash);
  BindI64(st.get(), 4, static_cast<int64_t>(r.created_at_ms));

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, const std::string& task_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(
      db, "SELECT task_id,performance_threshold,validation_data_hash,created_at_ms FROM tasks WHERE task_id=?;");

  BindText(st.get(), 1, task_id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadTaskRow(st.get());
}

std::optional<model::TaskRecord> SqliteRepository::GetCurrentTask(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT task_id,performance_threshold,validation_data_hash,created_at_ms FROM tasks "
                            "ORDER BY created_at_ms DESC, task_id DESC LIMIT 1;");

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadTaskRow(st.get());
}

} // namespace gate::db::sqlite
