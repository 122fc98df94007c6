#include "schema_registry.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace modeldb::db::schema {

using util::DeployError;
using util::ErrorKind;

std::shared_ptr<const TableSchema> SchemaRegistry::Describe(const std::string& table_name) {
  if (table_name.empty()) {
    throw DeployError(ErrorKind::kSchemaCreation, "table name must not be empty");
  }
  if (table_name.size() > kMaxTableNameLength) {
    throw DeployError(ErrorKind::kSchemaCreation,
                      "table name '" + table_name + "' exceeds " + std::to_string(kMaxTableNameLength) + " characters");
  }
  if (table_name.find('\0') != std::string::npos) {
    throw DeployError(ErrorKind::kSchemaCreation, "table name contains a NUL byte");
  }

  std::lock_guard lock(mutex_);
  auto [it, inserted] = schemas_.try_emplace(table_name);
  if (inserted) {
    it->second = TableSchema::ForDeployedModels(table_name);
  }
  return it->second;
}

std::shared_ptr<const TableSchema> SchemaRegistry::GetOrCreate(ModelStore& store, Transaction& tx, const std::string& table_name) {
  auto schema = Describe(table_name);

  Result created;
  try {
    created = store.EnsureTable(tx, *schema);
  } catch (const std::exception&) {
    util::ThrowWrapped(ErrorKind::kSchemaCreation, "failed to create table " + table_name);
  }

  if (created) {
    MODELDB_LOG_INFO("Created model table", {observability::StringField("table", table_name)});
    return schema;
  }
  if (created.code == ErrorCode::AlreadyExists) {
    return schema;
  }

  std::string message = "failed to create table " + table_name + ": " + ErrorCodeName(created.code);
  if (!created.message.empty()) {
    message += ": " + created.message;
  }
  throw DeployError(ErrorKind::kSchemaCreation, message);
}

std::size_t SchemaRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return schemas_.size();
}

} // namespace modeldb::db::schema
