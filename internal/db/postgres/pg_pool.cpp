#include "pg_pool.hpp"

namespace gate::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_miner", "SELECT miner_id, public_key FROM miners WHERE miner_id=$1");

  conn.prepare("upsert_miner",
               "INSERT INTO miners(miner_id, public_key) VALUES($1,$2) "
               "ON CONFLICT(miner_id) DO UPDATE SET public_key=EXCLUDED.public_key");

  conn.prepare("insert_ledger",
               "INSERT INTO ledger(id, task_id, miner_id, performance, hyperparameters, artifact_hash, timestamp) "
               "VALUES($1,$2,$3,$4,$5::jsonb,$6,to_timestamp($7))");

  conn.prepare("get_ledger",
               "SELECT id, task_id, miner_id, performance, hyperparameters::text, artifact_hash, "
               "extract(epoch from timestamp)::bigint FROM ledger WHERE id=$1");

  conn.prepare("upsert_task",
               "INSERT INTO tasks(task_id, performance_threshold, validation_data_hash, created_at_ms) "
               "VALUES($1,$2,$3,$4) ON CONFLICT(task_id) DO UPDATE SET "
               "performance_threshold=EXCLUDED.performance_threshold, "
               "validation_data_hash=EXCLUDED.validation_data_hash, created_at_ms=EXCLUDED.created_at_ms");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace gate::db::postgres
