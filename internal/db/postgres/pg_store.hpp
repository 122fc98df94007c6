#pragma once

#include "internal/db/api/model_store.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace modeldb::db::postgres {

class PgStore final : public db::ModelStore {
public:
  explicit PgStore(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result EnsureTable(Transaction&, const schema::TableSchema&) override;
  bool TableExists(Transaction&, const std::string& table_name) override;

  Result InsertModel(Transaction&, const schema::TableSchema&, model::DeployedModelRecord&) override;
  std::optional<model::DeployedModelRecord> FindModel(Transaction&, const schema::TableSchema&, int64_t model_id) override;
  int64_t CountModels(Transaction&, const schema::TableSchema&) override;

  // SQLSTATE -> portable code
  static ErrorCode TranslateSqlState(const std::string& sqlstate);

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

} // namespace modeldb::db::postgres
