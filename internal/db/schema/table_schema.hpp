#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/model/deployed_model_record.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace modeldb::db::schema {

namespace columns {
inline constexpr const char* kModelId               = "model_id";
inline constexpr const char* kModelName             = "model_name";
inline constexpr const char* kModelVersion          = "model_version";
inline constexpr const char* kModelFramework        = "model_framework";
inline constexpr const char* kModelFrameworkVersion = "model_framework_version";
inline constexpr const char* kModel                 = "model";
inline constexpr const char* kModelCreationTime     = "model_creation_time";
inline constexpr const char* kModelDeploymentTime   = "model_deployment_time";
inline constexpr const char* kDeployedBy            = "deployed_by";
inline constexpr const char* kModelDescription      = "model_description";
inline constexpr const char* kRunId                 = "run_id";
} // namespace columns

enum class ColumnType {
  kAutoInteger, // store-assigned primary key
  kInteger,
  kString,
  kBlob,
  kTimestamp
};

struct Column {
  std::string name;
  ColumnType  type       = ColumnType::kString;
  std::size_t max_length = 0; // kString only
  bool        nullable   = true;
};

/*
  Immutable row-schema descriptor bound to one table name.

  Column order is fixed: it is the order of CREATE TABLE, of INSERT
  parameters (auto columns excluded) and of SELECT results.
*/
class TableSchema {
 public:
  // Deployed-model layout for table_name.
  static std::shared_ptr<const TableSchema> ForDeployedModels(const std::string& table_name);

  TableSchema(std::string table_name, std::vector<Column> columns, std::string primary_key_constraint);

  const std::string& TableName() const {
    return table_name_;
  }

  const std::vector<Column>& Columns() const {
    return columns_;
  }

  const std::string& PrimaryKeyConstraint() const {
    return primary_key_constraint_;
  }

  // The single kAutoInteger column.
  const Column& KeyColumn() const;

  // Columns bound on insert, in order.
  std::vector<const Column*> InsertColumns() const;

  // Null and length checks every backend applies before insert.
  Result CheckRecord(const model::DeployedModelRecord& record) const;

  // Values for InsertColumns(), same order.
  sql::Params BindInsert(const model::DeployedModelRecord& record) const;

  // Inverse of a SELECT over Columns().
  model::DeployedModelRecord ReadRecord(const sql::Row& row) const;

 private:
  std::string         table_name_;
  std::vector<Column> columns_;
  std::string         primary_key_constraint_;
};

} // namespace modeldb::db::schema
