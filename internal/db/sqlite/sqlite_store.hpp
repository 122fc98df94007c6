#pragma once

#include <memory>

#include "internal/db/api/model_store.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace modeldb::db::sqlite {

class SqliteStore final : public db::ModelStore {
public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result EnsureTable(Transaction&, const schema::TableSchema&) override;
  bool TableExists(Transaction&, const std::string& table_name) override;

  Result InsertModel(Transaction&, const schema::TableSchema&, model::DeployedModelRecord&) override;
  std::optional<model::DeployedModelRecord> FindModel(Transaction&, const schema::TableSchema&, int64_t model_id) override;
  int64_t CountModels(Transaction&, const schema::TableSchema&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace modeldb::db::sqlite
