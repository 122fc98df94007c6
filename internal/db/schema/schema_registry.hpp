#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/model_store.hpp"
#include "internal/db/schema/table_schema.hpp"

namespace modeldb::db::schema {

/*
  SchemaRegistry

  table name -> immutable TableSchema, built once per name and shared by
  every deployment to that table.

  GetOrCreate also runs the store's "create if absent" inside the caller's
  transaction. An existing table is trusted as is; a table whose columns
  do not match shows up later as an insert error.

  One instance is built by the composition root and passed to whoever
  needs it. Safe for concurrent use.
*/
class SchemaRegistry {
 public:
  // Longest identifier postgres keeps without truncation.
  static constexpr std::size_t kMaxTableNameLength = 63;

  // Memoized descriptor; no store access. Throws DeployError(kSchemaCreation)
  // for names no backend can hold.
  std::shared_ptr<const TableSchema> Describe(const std::string& table_name);

  // Describe + create-if-absent through store. Throws
  // DeployError(kSchemaCreation) unless the table exists afterwards.
  std::shared_ptr<const TableSchema> GetOrCreate(ModelStore& store, Transaction& tx, const std::string& table_name);

  std::size_t Size() const;

 private:
  mutable std::mutex                                                  mutex_;
  std::unordered_map<std::string, std::shared_ptr<const TableSchema>> schemas_;
};

} // namespace modeldb::db::schema
