#include "memory_store.hpp"

#include "memory_tx.hpp"

namespace modeldb::db::memory {

MemoryStore::MemoryStore() = default;

std::unique_ptr<db::Transaction> MemoryStore::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryStore::EnsureTable(Transaction& t, const schema::TableSchema& schema) {
  auto& s = TX(t).Mutable();
  if (schema.TableName().empty()) return Result::Err(ErrorCode::InvalidName, "empty table name");
  if (s.tables.contains(schema.TableName())) return Result::Err(ErrorCode::AlreadyExists, schema.TableName());
  s.tables.emplace(schema.TableName(), Table{});
  s.tables_created++;
  return Result::Ok();
}

bool MemoryStore::TableExists(Transaction& t, const std::string& table_name) {
  return TX(t).View().tables.contains(table_name);
}

Result MemoryStore::InsertModel(Transaction& t, const schema::TableSchema& schema, model::DeployedModelRecord& r) {
  auto check = schema.CheckRecord(r);
  if (!check) return check;

  auto& s  = TX(t).Mutable();
  auto  it = s.tables.find(schema.TableName());
  if (it == s.tables.end()) return Result::Err(ErrorCode::NotFound, "no such table: " + schema.TableName());

  auto& table   = it->second;
  r.model_id    = table.next_id++;
  table.rows[r.model_id] = r;
  return Result::Ok();
}

std::optional<model::DeployedModelRecord> MemoryStore::FindModel(Transaction& t, const schema::TableSchema& schema,
                                                                 int64_t model_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tables.find(schema.TableName());
  if (it == s.tables.end()) return std::nullopt;

  auto row = it->second.rows.find(model_id);
  if (row == it->second.rows.end()) return std::nullopt;
  return row->second;
}

int64_t MemoryStore::CountModels(Transaction& t, const schema::TableSchema& schema) {
  const auto& s  = TX(t).View();
  auto        it = s.tables.find(schema.TableName());
  if (it == s.tables.end()) return 0;
  return static_cast<int64_t>(it->second.rows.size());
}

uint64_t MemoryStore::TablesCreated() const {
  std::scoped_lock lock(mutex_);
  return committed_.tables_created;
}

} // namespace modeldb::db::memory
