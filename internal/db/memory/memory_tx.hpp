#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace keyshop::db::memory {

/*
  Transaction = snapshot + write set

  Commit of a transaction that wrote anything fails with
  SerializationFailure when another writer committed after the snapshot
  was taken; RunWithRetry re-runs it on a fresh snapshot. Read-only
  transactions always commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    dirty_            = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace keyshop::db::memory
