#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace modeldb::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) {
    return;
  }
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    MODELDB_LOG_WARN("postgres abort in destructor failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  // pqxx aborts the transaction itself when commit throws
  finished_ = true;
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace modeldb::db::postgres
