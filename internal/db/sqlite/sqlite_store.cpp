#include "sqlite_store.hpp"

#include <stdexcept>
#include <variant>

#include "internal/db/sql/sql_dialect.hpp"

namespace modeldb::db::sqlite {

using modeldb::db::ErrorCode;
using modeldb::db::Result;
using schema::ColumnType;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  std::string GetBlob(int col) const override {
    const void* data = sqlite3_column_blob(st_, col);
    const int   size = sqlite3_column_bytes(st_, col);
    if (!data || size <= 0) return {};
    return std::string(static_cast<const char*>(data), static_cast<std::size_t>(size));
  }

  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    return nullptr;
  }
  return Statement(st);
}

int Bind(sqlite3_stmt* st, int idx, ColumnType type, const sql::Param& param) {
  if (std::holds_alternative<std::nullptr_t>(param)) {
    return sqlite3_bind_null(st, idx);
  }
  if (const auto* v = std::get_if<int64_t>(&param)) {
    return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
  }
  if (const auto* tp = std::get_if<util::TimePoint>(&param)) {
    return sqlite3_bind_text(st, idx, util::FormatTimestamp(*tp).c_str(), -1, SQLITE_TRANSIENT);
  }

  const auto& s = std::get<std::string>(param);
  if (type == ColumnType::kBlob) {
    return sqlite3_bind_blob64(st, idx, s.data(), static_cast<sqlite3_uint64>(s.size()), SQLITE_TRANSIENT);
  }
  return sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteStore::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteStore::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_AUTH:
    case SQLITE_PERM:
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::PermissionDenied, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Tables
// ------------------------------------------------------------------

bool SqliteStore::TableExists(Transaction& t, const std::string& table_name) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=? COLLATE NOCASE;");
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

  if (sqlite3_bind_text(st.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite bind: ") + sqlite3_errmsg(db));
  }
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return rc == SQLITE_ROW;
}

Result SqliteStore::EnsureTable(Transaction& t, const schema::TableSchema& schema) {
  auto* db = TX(t).Handle();

  // the write lock from BEGIN IMMEDIATE makes check-then-create race free.
  // sqlite table names are case-insensitive, so is the check.
  if (TableExists(t, schema.TableName())) {
    return Result::Err(ErrorCode::AlreadyExists, schema.TableName());
  }

  const auto sql = sql::RenderCreateTable(schema, sql::Dialect::kSqlite);
  auto       st  = Prepare(db, sql);
  if (!st) {
    auto err = Translate(db, sqlite3_errcode(db));
    if (err.code == ErrorCode::InternalError) err.code = ErrorCode::InvalidName;
    return err;
  }
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Rows
// ------------------------------------------------------------------

Result SqliteStore::InsertModel(Transaction& t, const schema::TableSchema& schema, model::DeployedModelRecord& r) {
  auto check = schema.CheckRecord(r);
  if (!check) return check;

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::RenderInsert(schema, sql::Dialect::kSqlite));
  if (!st) return Translate(db, sqlite3_errcode(db));

  const auto columns = schema.InsertColumns();
  const auto params  = schema.BindInsert(r);
  for (std::size_t i = 0; i < params.size(); ++i) {
    int rc = Bind(st.get(), static_cast<int>(i + 1), columns[i]->type, params[i]);
    if (rc != SQLITE_OK) return Translate(db, rc);
  }

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.model_id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::optional<model::DeployedModelRecord> SqliteStore::FindModel(Transaction& t, const schema::TableSchema& schema,
                                                                 int64_t model_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::RenderSelectById(schema, sql::Dialect::kSqlite));
  // missing table
  if (!st) return std::nullopt;

  if (sqlite3_bind_int64(st.get(), 1, model_id) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite bind: ") + sqlite3_errmsg(db));
  }
  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }

  return schema.ReadRecord(SqliteRow(st.get()));
}

int64_t SqliteStore::CountModels(Transaction& t, const schema::TableSchema& schema) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::RenderCount(schema));
  if (!st) return 0;

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return sqlite3_column_int64(st.get(), 0);
}

} // namespace modeldb::db::sqlite
