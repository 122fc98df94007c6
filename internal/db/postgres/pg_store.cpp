#include "pg_store.hpp"

#include <cstddef>
#include <variant>

#include "internal/db/sql/sql_dialect.hpp"

namespace modeldb::db::postgres {

using schema::ColumnType;

namespace {

class PgRow final : public sql::Row {
 public:
  explicit PgRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    return row_[col].c_str();
  }

  std::string GetBlob(int col) const override {
    auto bytes = row_[col].as<std::basic_string<std::byte>>();
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  }

  int64_t GetInt64(int col) const override {
    return row_[col].as<int64_t>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  const pqxx::row& row_;
};

// params holds views into values; values must outlive the exec call
pqxx::params ToPgParams(const std::vector<const schema::Column*>& columns, const sql::Params& values) {
  pqxx::params params;
  for (std::size_t i = 0; i < values.size(); ++i) {
    const auto& value = values[i];
    if (std::holds_alternative<std::nullptr_t>(value)) {
      params.append();
    } else if (const auto* v = std::get_if<int64_t>(&value)) {
      params.append(*v);
    } else if (const auto* tp = std::get_if<util::TimePoint>(&value)) {
      params.append(util::FormatTimestamp(*tp));
    } else if (columns[i]->type == ColumnType::kBlob) {
      params.append(pqxx::binary_cast(std::get<std::string>(value)));
    } else {
      params.append(std::get<std::string>(value));
    }
  }
  return params;
}

} // namespace

PgStore::PgStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgStore::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgStore::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

ErrorCode PgStore::TranslateSqlState(const std::string& sqlstate) {
  if (sqlstate == "42P07" || sqlstate == "23505" || sqlstate == "42710") return ErrorCode::AlreadyExists;
  if (sqlstate == "42501") return ErrorCode::PermissionDenied;
  if (sqlstate == "42602" || sqlstate == "42601" || sqlstate == "42622") return ErrorCode::InvalidName;
  if (sqlstate == "40001" || sqlstate == "40P01") return ErrorCode::SerializationFailure;
  if (sqlstate == "55P03") return ErrorCode::Busy;
  if (sqlstate.rfind("23", 0) == 0 || sqlstate == "22001") return ErrorCode::ConstraintViolation;
  if (sqlstate == "42P01") return ErrorCode::NotFound;
  if (sqlstate.rfind("58", 0) == 0 || sqlstate.rfind("53", 0) == 0) return ErrorCode::IOError;
  return ErrorCode::InternalError;
}

Result PgStore::Translate(const std::exception& e) {
  if (const auto* sql_error = dynamic_cast<const pqxx::sql_error*>(&e)) {
    return Result::Err(TranslateSqlState(sql_error->sqlstate()), e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

bool PgStore::TableExists(Transaction& t, const std::string& table_name) {
  auto res = TX(t).Work().exec_params("SELECT to_regclass($1) IS NOT NULL;", sql::QuoteIdentifier(table_name));
  return res[0][0].as<bool>();
}

Result PgStore::EnsureTable(Transaction& t, const schema::TableSchema& schema) {
  auto& work = TX(t).Work();
  try {
    if (TableExists(t, schema.TableName())) {
      return Result::Err(ErrorCode::AlreadyExists, schema.TableName());
    }

    // A concurrent creator can still win between the check and the CREATE
    // (duplicate pg_type row, 23505). The savepoint keeps the outer
    // transaction usable so that case reads as AlreadyExists.
    pqxx::subtransaction create(work, "ensure_table");
    create.exec(sql::RenderCreateTable(schema, sql::Dialect::kPostgres));
    create.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgStore::InsertModel(Transaction& t, const schema::TableSchema& schema, model::DeployedModelRecord& r) {
  auto check = schema.CheckRecord(r);
  if (!check) return check;

  try {
    const auto values = schema.BindInsert(r);
    auto res = TX(t).Work().exec_params(sql::RenderInsert(schema, sql::Dialect::kPostgres),
                                        ToPgParams(schema.InsertColumns(), values));
    r.model_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeployedModelRecord> PgStore::FindModel(Transaction& t, const schema::TableSchema& schema,
                                                             int64_t model_id) {
  auto res = TX(t).Work().exec_params(sql::RenderSelectById(schema, sql::Dialect::kPostgres), model_id);
  if (res.empty()) return std::nullopt;

  const pqxx::row row = res[0];
  return schema.ReadRecord(PgRow(row));
}

int64_t PgStore::CountModels(Transaction& t, const schema::TableSchema& schema) {
  auto res = TX(t).Work().exec(sql::RenderCount(schema));
  return res[0][0].as<int64_t>();
}

} // namespace modeldb::db::postgres
