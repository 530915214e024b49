#include "memory_tx.hpp"

#include <stdexcept>

namespace gate::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_) return;
  if (rolled_back_) throw std::runtime_error("commit after rollback");

  std::scoped_lock lock(repo_.mutex_);
  auto&            state = repo_.committed_;

  for (const auto& [id, _] : writes_.ledger) {
    if (state.ledger.contains(id)) {
      throw std::runtime_error("transaction conflict: ledger id already committed: " + id);
    }
  }

  for (auto& [id, miner] : writes_.miners) state.miners[id] = std::move(miner);
  for (auto& [id, row] : writes_.ledger) state.ledger.emplace(id, std::move(row));
  for (auto& [id, task] : writes_.tasks) state.tasks[id] = std::move(task);

  writes_    = {};
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_      = {};
  rolled_back_ = true;
}

} // namespace gate::db::memory
