#include "table_schema.hpp"

#include <stdexcept>
#include <string_view>

namespace modeldb::db::schema {

namespace {

template <typename T>
sql::Param Optional(const std::optional<T>& value) {
  if (!value) return nullptr;
  return sql::Param{*value};
}

sql::Param FieldValue(const model::DeployedModelRecord& r, std::string_view column) {
  if (column == columns::kModelId) return r.model_id;
  if (column == columns::kModelName) return r.model_name;
  if (column == columns::kModelVersion) return r.model_version;
  if (column == columns::kModelFramework) return r.model_framework;
  if (column == columns::kModelFrameworkVersion) return r.model_framework_version;
  if (column == columns::kModel) return r.model;
  if (column == columns::kModelCreationTime) return Optional(r.model_creation_time);
  if (column == columns::kModelDeploymentTime) return Optional(r.model_deployment_time);
  if (column == columns::kDeployedBy) return Optional(r.deployed_by);
  if (column == columns::kModelDescription) return Optional(r.model_description);
  if (column == columns::kRunId) return Optional(r.run_id);
  throw std::logic_error("unknown column: " + std::string(column));
}

std::optional<util::TimePoint> ReadTimestamp(const sql::Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  auto text   = row.GetText(col);
  auto parsed = util::ParseTimestamp(text);
  if (!parsed) {
    throw std::runtime_error("unparseable timestamp: " + text);
  }
  return parsed;
}

std::optional<std::string> ReadOptionalText(const sql::Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  return row.GetText(col);
}

} // namespace

std::shared_ptr<const TableSchema> TableSchema::ForDeployedModels(const std::string& table_name) {
  std::vector<Column> cols = {
      {columns::kModelId, ColumnType::kAutoInteger, 0, false},
      {columns::kModelName, ColumnType::kString, 256, false},
      {columns::kModelVersion, ColumnType::kString, 50, false},
      {columns::kModelFramework, ColumnType::kString, 50, false},
      {columns::kModelFrameworkVersion, ColumnType::kString, 50, false},
      {columns::kModel, ColumnType::kBlob, 0, false},
      {columns::kModelCreationTime, ColumnType::kTimestamp, 0, true},
      {columns::kModelDeploymentTime, ColumnType::kTimestamp, 0, false},
      {columns::kDeployedBy, ColumnType::kInteger, 0, true},
      {columns::kModelDescription, ColumnType::kString, 1024, true},
      {columns::kRunId, ColumnType::kString, 100, true},
  };
  return std::make_shared<const TableSchema>(table_name, std::move(cols), "model_pk_" + table_name);
}

TableSchema::TableSchema(std::string table_name, std::vector<Column> columns, std::string primary_key_constraint)
    : table_name_(std::move(table_name)),
      columns_(std::move(columns)),
      primary_key_constraint_(std::move(primary_key_constraint)) {
}

const Column& TableSchema::KeyColumn() const {
  for (const auto& c : columns_) {
    if (c.type == ColumnType::kAutoInteger) return c;
  }
  throw std::logic_error("schema has no key column: " + table_name_);
}

std::vector<const Column*> TableSchema::InsertColumns() const {
  std::vector<const Column*> out;
  out.reserve(columns_.size());
  for (const auto& c : columns_) {
    if (c.type != ColumnType::kAutoInteger) out.push_back(&c);
  }
  return out;
}

Result TableSchema::CheckRecord(const model::DeployedModelRecord& record) const {
  for (const auto* column : InsertColumns()) {
    const auto value = FieldValue(record, column->name);

    if (std::holds_alternative<std::nullptr_t>(value)) {
      if (!column->nullable) {
        return Result::Err(ErrorCode::ConstraintViolation, column->name + " must not be null");
      }
      continue;
    }

    if (column->type == ColumnType::kString && column->max_length > 0) {
      const auto& text = std::get<std::string>(value);
      if (text.size() > column->max_length) {
        return Result::Err(ErrorCode::ConstraintViolation,
                           column->name + " exceeds " + std::to_string(column->max_length) + " characters");
      }
    }
  }
  return Result::Ok();
}

sql::Params TableSchema::BindInsert(const model::DeployedModelRecord& record) const {
  sql::Params params;
  for (const auto* column : InsertColumns()) {
    params.push_back(FieldValue(record, column->name));
  }
  return params;
}

model::DeployedModelRecord TableSchema::ReadRecord(const sql::Row& row) const {
  model::DeployedModelRecord r;
  for (int i = 0; i < static_cast<int>(columns_.size()); ++i) {
    const std::string_view name = columns_[i].name;

    if (name == columns::kModelId) {
      r.model_id = row.GetInt64(i);
    } else if (name == columns::kModelName) {
      r.model_name = row.GetText(i);
    } else if (name == columns::kModelVersion) {
      r.model_version = row.GetText(i);
    } else if (name == columns::kModelFramework) {
      r.model_framework = row.GetText(i);
    } else if (name == columns::kModelFrameworkVersion) {
      r.model_framework_version = row.GetText(i);
    } else if (name == columns::kModel) {
      r.model = row.IsNull(i) ? std::string{} : row.GetBlob(i);
    } else if (name == columns::kModelCreationTime) {
      r.model_creation_time = ReadTimestamp(row, i);
    } else if (name == columns::kModelDeploymentTime) {
      r.model_deployment_time = ReadTimestamp(row, i);
    } else if (name == columns::kDeployedBy) {
      if (!row.IsNull(i)) r.deployed_by = row.GetInt64(i);
    } else if (name == columns::kModelDescription) {
      r.model_description = ReadOptionalText(row, i);
    } else if (name == columns::kRunId) {
      r.run_id = ReadOptionalText(row, i);
    }
  }
  return r;
}

} // namespace modeldb::db::schema
