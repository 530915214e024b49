#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace gate::db::memory {

namespace {

bool NewerThan(const model::TaskRecord& a, const model::TaskRecord& b) {
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
  return a.task_id > b.task_id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertMiner(Transaction& t, const model::MinerRecord& r) {
  TX(t).Writes().miners[r.miner_id] = r;
  return Result::Ok();
}

std::optional<model::MinerRecord> MemoryRepository::GetMiner(Transaction& t, int64_t miner_id) {
  auto& w  = TX(t).Writes();
  auto  it = w.miners.find(miner_id);
  if (it != w.miners.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             c = committed_.miners.find(miner_id);
  if (c == committed_.miners.end()) return std::nullopt;
  return c->second;
}

Result MemoryRepository::InsertLedger(Transaction& t, const model::LedgerRecord& r) {
  auto& w = TX(t).Writes();
  if (w.ledger.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  {
    std::scoped_lock lock(mutex_);
    if (committed_.ledger.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  }
  w.ledger.emplace(r.id, r);
  return Result::Ok();
}

std::optional<model::LedgerRecord> MemoryRepository::GetLedger(Transaction& t, const std::string& id) {
  auto& w  = TX(t).Writes();
  auto  it = w.ledger.find(id);
  if (it != w.ledger.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             c = committed_.ledger.find(id);
  if (c == committed_.ledger.end()) return std::nullopt;
  return c->second;
}

std::vector<model::LedgerRecord> MemoryRepository::ListLedger(Transaction& t) {
  std::map<std::string, model::LedgerRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    merged = committed_.ledger;
  }
  for (const auto& [id, row] : TX(t).Writes().ledger) merged[id] = row;

  std::vector<model::LedgerRecord> out;
  out.reserve(merged.size());
  for (auto& [_, row] : merged) out.push_back(std::move(row));
  return out;
}

Result MemoryRepository::UpsertTask(Transaction& t, const model::TaskRecord& r) {
  TX(t).Writes().tasks[r.task_id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& task_id) {
  auto& w  = TX(t).Writes();
  auto  it = w.tasks.find(task_id);
  if (it != w.tasks.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             c = committed_.tasks.find(task_id);
  if (c == committed_.tasks.end()) return std::nullopt;
  return c->second;
}

std::optional<model::TaskRecord> MemoryRepository::GetCurrentTask(Transaction& t) {
  std::optional<model::TaskRecord> best;
  auto consider = [&](const model::TaskRecord& r) {
    if (!best || NewerThan(r, *best)) best = r;
  };

  auto& w = TX(t).Writes();
  {
    std::scoped_lock lock(mutex_);
    for (const auto& [id, r] : committed_.tasks) {
      if (!w.tasks.contains(id)) consider(r);
    }
  }
  for (const auto& [_, r] : w.tasks) consider(r);
  return best;
}

} // namespace gate::db::memory
