#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace modeldb::db::sqlite {

struct SqliteOptions {
  int  busy_timeout_ms = 5000;
  bool wal_mode        = true;
};

/*
  Thin RAII wrapper around sqlite3*.

  One handle is shared by every transaction of a store; TxMutex()
  serializes them since a sqlite connection has a single transaction
  state.
*/
class SqliteDB {
 public:
  // ":memory:" opens a private in-memory database.
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas and transaction control)
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace modeldb::db::sqlite
