#pragma once

#include <string>

#include "internal/db/schema/table_schema.hpp"

namespace modeldb::db::sql {

/*
  Statement rendering for a TableSchema.

  Identifiers are always double-quoted, so any table name the store
  accepts is safe to splice. Values never are: they go through Params.
*/

enum class Dialect {
  kPostgres,
  kSqlite
};

std::string QuoteIdentifier(const std::string& name);

// CREATE TABLE IF NOT EXISTS ...
std::string RenderCreateTable(const schema::TableSchema& schema, Dialect dialect);

// INSERT over schema.InsertColumns(); postgres variant ends in RETURNING <key>.
std::string RenderInsert(const schema::TableSchema& schema, Dialect dialect);

// SELECT <all columns> ... WHERE <key> = <param 1>
std::string RenderSelectById(const schema::TableSchema& schema, Dialect dialect);

std::string RenderCount(const schema::TableSchema& schema);

} // namespace modeldb::db::sql
