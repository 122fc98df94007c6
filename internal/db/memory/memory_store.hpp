#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/model_store.hpp"

namespace modeldb::db::memory {

class MemoryTransaction;

/*
  In-process store.

  Used by tests and for dry runs (memory:// URIs). Snapshot on Begin,
  publish on Commit. Like SqliteDB::TxMutex(), tx_mutex_ serializes
  transactions: a Begin blocks while another transaction is open.
*/
class MemoryStore final : public db::ModelStore {
public:
  MemoryStore();

  std::unique_ptr<Transaction> Begin() override;

  Result EnsureTable(Transaction&, const schema::TableSchema&) override;
  bool TableExists(Transaction&, const std::string& table_name) override;

  Result InsertModel(Transaction&, const schema::TableSchema&, model::DeployedModelRecord&) override;
  std::optional<model::DeployedModelRecord> FindModel(Transaction&, const schema::TableSchema&, int64_t model_id) override;
  int64_t CountModels(Transaction&, const schema::TableSchema&) override;

  // Number of committed table creations since construction.
  uint64_t TablesCreated() const;

private:
  friend class MemoryTransaction;

  struct Table {
    std::map<int64_t, model::DeployedModelRecord> rows;
    int64_t next_id = 1;
  };

  struct State {
    std::unordered_map<std::string, Table> tables;
    uint64_t tables_created = 0;
  };

  mutable std::mutex mutex_;
  std::mutex tx_mutex_;
  State committed_;
};

} // namespace modeldb::db::memory
