#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace modeldb::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    MODELDB_LOG_WARN("sqlite rollback in destructor failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (...) {
    // a failed COMMIT can leave the transaction open; abort it so the
    // handle is clean for the next Begin()
    if (!sqlite3_get_autocommit(db_->Handle()) &&
        sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      MODELDB_LOG_WARN("sqlite rollback after failed commit failed",
                       {observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
    }
    finished_ = true;
    lock_.unlock();
    throw;
  }
  committed_ = true;
  finished_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (...) {
    lock_.unlock();
    throw;
  }
  lock_.unlock();
}

} // namespace modeldb::db::sqlite
