#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace gate::db::memory {

/*
  Transaction = write set over the committed state.

  Reads consult the write set first, then the committed state.
  Commit applies the write set atomically; a ledger id committed by someone
  else in the meantime fails the whole commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Writes() {
    return writes_;
  }

  MemoryRepository& Repo() {
    return repo_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State writes_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace gate::db::memory
