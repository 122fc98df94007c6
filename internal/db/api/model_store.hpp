#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/deployed_model_record.hpp"
#include "internal/db/schema/table_schema.hpp"

namespace modeldb::db {

/*
  Store abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A transaction holds its connection until destroyed
  - Table creation is "create if absent": an existing table of the same
    name is reported as AlreadyExists and its structure is not inspected

  The store is the source of truth for model_id assignment.
*/

class ModelStore {
 public:
  virtual ~ModelStore() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tables
  // ---------------------------------------------------------------------

  virtual Result EnsureTable(Transaction&, const schema::TableSchema&) = 0;

  virtual bool TableExists(Transaction&, const std::string& table_name) = 0;

  // ---------------------------------------------------------------------
  // Rows
  // ---------------------------------------------------------------------

  // Sets record.model_id on success.
  virtual Result InsertModel(Transaction&, const schema::TableSchema&, model::DeployedModelRecord&) = 0;

  virtual std::optional<model::DeployedModelRecord> FindModel(Transaction&, const schema::TableSchema&, int64_t model_id) = 0;

  virtual int64_t CountModels(Transaction&, const schema::TableSchema&) = 0;
};

} // namespace modeldb::db
