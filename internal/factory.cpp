#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cache/memory/memory_replay_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if GATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if GATE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if GATE_CACHE_REDIS
#include "internal/cache/redis/redis_pool.hpp"
#include "internal/cache/redis/redis_replay_store.hpp"
#endif

namespace gate::factory {

namespace {

#if GATE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT miner_id,public_key FROM miners LIMIT 1;");
  sqlite_db->Exec("SELECT id,task_id,miner_id,performance,hyperparameters,artifact_hash,timestamp FROM ledger LIMIT 1;");
}
#endif

#if GATE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT miner_id,public_key FROM miners LIMIT 1;");
  tx.exec("SELECT id,task_id,miner_id,performance,hyperparameters,artifact_hash,timestamp FROM ledger LIMIT 1;");
  tx.commit();
}
#endif

void SeedMiners(db::Repository& repository, const gate::runtime::config::MemoryDatabaseConfig& memory) {
  if (memory.miners_size() == 0) return;

  auto tx = repository.Begin();
  for (const auto& seed : memory.miners()) {
    db::model::MinerRecord record;
    record.miner_id       = seed.miner_id();
    record.public_key_hex = seed.public_key();
    auto result           = repository.UpsertMiner(*tx, record);
    if (!result) {
      throw std::runtime_error("seed miner " + std::to_string(seed.miner_id()) + ": " + result.message);
    }
  }
  tx->Commit();
}

gate::v1::TaskInfo DefaultTask(const gate::runtime::config::RuntimeConfig& config) {
  gate::v1::TaskInfo task;
  task.set_task_id(config.task().task_id());
  task.set_performance_threshold(config.task().performance_threshold());
  task.set_validation_data_hash(config.task().validation_data_hash());
  return task;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const gate::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if GATE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    GATE_LOG_INFO("using sqlite store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if GATE_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().pool_size());
    BootstrapPostgresSchema(pool);
    GATE_LOG_INFO("using postgres store", {observability::IntField("pool_size", database.postgres().pool_size())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  auto repository = std::make_shared<db::memory::MemoryRepository>();
  SeedMiners(*repository, database.memory());
  GATE_LOG_WARN("using in-memory store; ledger is lost on exit");
  return repository;
}

std::shared_ptr<cache::ReplayStore> BuildReplayStore(const gate::runtime::config::RuntimeConfig& config) {
  const auto& cache = config.cache();
  if (cache.has_redis()) {
#if GATE_CACHE_REDIS
    const auto& redis = cache.redis();
    auto        pool  = std::make_shared<cache::redis::RedisPool>(cache::redis::RedisEndpoint::Parse(redis.url()), redis.pool_size(),
                                                                  std::chrono::milliseconds(redis.connect_timeout_ms()),
                                                                  std::chrono::milliseconds(redis.command_timeout_ms()));
    GATE_LOG_INFO("using redis replay store", {observability::IntField("pool_size", redis.pool_size())});
    return std::make_shared<cache::redis::RedisReplayStore>(std::move(pool));
#else
    throw std::runtime_error("redis cache requested but not enabled at build time");
#endif
  }

  GATE_LOG_WARN("using in-process replay store; replay protection is per instance");
  return std::make_shared<cache::memory::MemoryReplayStore>(cache.memory().max_entries());
}

/*
    Build full application dependency graph
*/
Application Build(const gate::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  app.repository   = BuildRepository(config);
  app.replay_store = BuildReplayStore(config);

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  const auto&           verification = config.verification();
  core::PipelineContext pipeline_ctx;
  pipeline_ctx.replay_store   = app.replay_store;
  pipeline_ctx.repository     = app.repository;
  pipeline_ctx.max_clock_skew = std::chrono::seconds(verification.max_clock_skew_sec());
  pipeline_ctx.max_age        = std::chrono::seconds(verification.max_age_sec());
  pipeline_ctx.replay_ttl     = std::chrono::seconds(verification.replay_ttl_sec());
  pipeline_ctx.now_unix_sec   = [] { return util::ToUnixSeconds(util::Now()); };

  app.pipeline = std::make_shared<core::SubmissionPipeline>(std::move(pipeline_ctx));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.pipeline     = app.pipeline;
  ctx.repository   = app.repository;
  ctx.default_task = DefaultTask(config);

  app.submission_service = std::make_shared<service::SubmissionService>(ctx);
  app.admin_service      = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // HTTP
  // ------------------------------------------------------------------
  app.http_handler = std::make_shared<http::HttpHandler>(app.submission_service);

  const auto& server                 = config.server();
  app.server_options.bind_address   = server.bind_address();
  app.server_options.io_threads     = server.io_threads();
  app.server_options.worker_threads = server.worker_threads();
  app.server_options.max_body_bytes = server.max_body_bytes();
  app.server_options.read_timeout   = std::chrono::milliseconds(server.read_timeout_ms());

  return app;
}

} // namespace gate::factory
