#pragma once

#include <vector>

namespace gate::db::sql {

/*
  Bootstrap DDL, one list per backend.

  miners.public_key and ledger.timestamp are shared with databases
  written by the registration process; do not rename them.
*/

static const std::vector<const char*> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS miners (miner_id INTEGER PRIMARY KEY, public_key TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS ledger (id TEXT PRIMARY KEY, task_id TEXT NOT NULL, miner_id INTEGER NOT NULL, performance REAL NOT NULL, hyperparameters TEXT NOT NULL, artifact_hash TEXT NOT NULL, timestamp TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS tasks (task_id TEXT PRIMARY KEY, performance_threshold REAL NOT NULL, validation_data_hash TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS ledger_miner_idx ON ledger(miner_id);"};

static const std::vector<const char*> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS miners (miner_id BIGINT PRIMARY KEY, public_key TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS ledger (id TEXT PRIMARY KEY, task_id TEXT NOT NULL, miner_id BIGINT NOT NULL, performance DOUBLE PRECISION NOT NULL, hyperparameters JSONB NOT NULL, artifact_hash TEXT NOT NULL, timestamp TIMESTAMPTZ NOT NULL);",
    "CREATE TABLE IF NOT EXISTS tasks (task_id TEXT PRIMARY KEY, performance_threshold DOUBLE PRECISION NOT NULL, validation_data_hash TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS ledger_miner_idx ON ledger(miner_id);"};

} // namespace gate::db::sql
