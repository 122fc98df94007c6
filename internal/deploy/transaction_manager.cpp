#include "internal/deploy/transaction_manager.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace modeldb::deploy {

using util::DeployError;
using util::ErrorKind;

TransactionManager::TransactionManager(db::ModelStore& store) : store_(store) {
}

std::unique_ptr<db::Transaction> TransactionManager::Open() {
  try {
    return store_.Begin();
  } catch (const DeployError&) {
    throw;
  } catch (...) {
    util::ThrowWrapped(ErrorKind::kInternal, "failed to open transaction");
  }
}

void TransactionManager::Run(db::Transaction& tx, const std::function<void()>& body) {
  try {
    body();
  } catch (const DeployError&) {
    RollbackAfterFailure(tx);
    throw;
  } catch (...) {
    RollbackAfterFailure(tx);
    util::ThrowWrapped(ErrorKind::kInternal, "deployment transaction failed");
  }
}

void TransactionManager::Commit(db::Transaction& tx) {
  try {
    tx.Commit();
  } catch (...) {
    util::ThrowWrapped(ErrorKind::kCommit, "commit rejected by store");
  }
}

void TransactionManager::RollbackAfterFailure(db::Transaction& tx) noexcept {
  try {
    tx.Rollback();
  } catch (const std::exception& e) {
    MODELDB_LOG_WARN("Rollback failed", {observability::StringField("error", e.what())});
  } catch (...) {
    MODELDB_LOG_WARN("Rollback failed", {observability::StringField("error", "unknown error")});
  }
}

} // namespace modeldb::deploy
