#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_store.hpp"

namespace modeldb::db::memory {

/*
  Transaction = snapshot + write set

  Holds the store's TxMutex from Begin until Commit or Rollback, so
  transactions on one store run one at a time.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryStore& store);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryStore::State& Mutable() {
    return working_;
  }
  const MemoryStore::State& View() const {
    return working_;
  }

 private:
  MemoryStore&                 store_;
  std::unique_lock<std::mutex> tx_lock_;
  MemoryStore::State           working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace modeldb::db::memory
