#include "memory_tx.hpp"

#include <stdexcept>

namespace modeldb::db::memory {

MemoryTransaction::MemoryTransaction(MemoryStore& store) : store_(store), tx_lock_(store.tx_mutex_) {
  std::scoped_lock lock(store_.mutex_);
  working_ = store_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  {
    std::scoped_lock lock(store_.mutex_);
    store_.committed_ = std::move(working_);
  }
  committed_ = true;
  tx_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }
  rolled_back_ = true;
  working_     = {};
  tx_lock_.unlock();
}

} // namespace modeldb::db::memory
