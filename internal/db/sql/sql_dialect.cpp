#include "sql_dialect.hpp"

#include <sstream>

namespace modeldb::db::sql {

using schema::Column;
using schema::ColumnType;

namespace {

std::string Placeholder(Dialect dialect, std::size_t index) {
  if (dialect == Dialect::kPostgres) {
    return "$" + std::to_string(index);
  }
  return "?";
}

std::string ColumnDefinition(const Column& column, const std::string& pk_constraint, Dialect dialect) {
  std::string def = QuoteIdentifier(column.name) + " ";

  switch (column.type) {
    case ColumnType::kAutoInteger:
      // sqlite only honours AUTOINCREMENT on an inline primary key
      if (dialect == Dialect::kSqlite) {
        return def + "INTEGER CONSTRAINT " + QuoteIdentifier(pk_constraint) + " PRIMARY KEY AUTOINCREMENT";
      }
      return def + "INTEGER GENERATED BY DEFAULT AS IDENTITY";
    case ColumnType::kInteger:
      def += dialect == Dialect::kPostgres ? "BIGINT" : "INTEGER";
      break;
    case ColumnType::kString:
      def += "VARCHAR(" + std::to_string(column.max_length) + ")";
      break;
    case ColumnType::kBlob:
      def += dialect == Dialect::kPostgres ? "BYTEA" : "BLOB";
      break;
    case ColumnType::kTimestamp:
      def += dialect == Dialect::kPostgres ? "TIMESTAMP" : "TEXT";
      break;
  }

  if (!column.nullable) {
    def += " NOT NULL";
  }
  return def;
}

std::string ColumnList(const schema::TableSchema& schema) {
  std::string out;
  for (const auto& c : schema.Columns()) {
    if (!out.empty()) out += ",";
    out += QuoteIdentifier(c.name);
  }
  return out;
}

} // namespace

std::string QuoteIdentifier(const std::string& name) {
  std::string out = "\"";
  for (char c : name) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::string RenderCreateTable(const schema::TableSchema& schema, Dialect dialect) {
  std::ostringstream sql;
  sql << "CREATE TABLE IF NOT EXISTS " << QuoteIdentifier(schema.TableName()) << " (";

  bool first = true;
  for (const auto& c : schema.Columns()) {
    if (!first) sql << ", ";
    first = false;
    sql << ColumnDefinition(c, schema.PrimaryKeyConstraint(), dialect);
  }

  if (dialect == Dialect::kPostgres) {
    sql << ", CONSTRAINT " << QuoteIdentifier(schema.PrimaryKeyConstraint()) << " PRIMARY KEY ("
        << QuoteIdentifier(schema.KeyColumn().name) << ")";
  }

  sql << ");";
  return sql.str();
}

std::string RenderInsert(const schema::TableSchema& schema, Dialect dialect) {
  std::ostringstream names;
  std::ostringstream values;

  std::size_t index = 0;
  for (const auto* c : schema.InsertColumns()) {
    if (index > 0) {
      names << ",";
      values << ",";
    }
    ++index;
    names << QuoteIdentifier(c->name);
    values << Placeholder(dialect, index);
  }

  std::string sql = "INSERT INTO " + QuoteIdentifier(schema.TableName()) + "(" + names.str() + ") VALUES(" + values.str() + ")";
  if (dialect == Dialect::kPostgres) {
    sql += " RETURNING " + QuoteIdentifier(schema.KeyColumn().name);
  }
  return sql + ";";
}

std::string RenderSelectById(const schema::TableSchema& schema, Dialect dialect) {
  return "SELECT " + ColumnList(schema) + " FROM " + QuoteIdentifier(schema.TableName()) + " WHERE " +
         QuoteIdentifier(schema.KeyColumn().name) + "=" + Placeholder(dialect, 1) + ";";
}

std::string RenderCount(const schema::TableSchema& schema) {
  return "SELECT COUNT(*) FROM " + QuoteIdentifier(schema.TableName()) + ";";
}

} // namespace modeldb::db::sql
