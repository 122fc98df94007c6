#include "store_provider.hpp"

#include "internal/db/memory/memory_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if MODELDB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#endif
#if MODELDB_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_store.hpp"
#endif

namespace modeldb::db {

using util::DeployError;
using util::ErrorKind;

std::shared_ptr<ModelStore> OpenStore(const DatabaseUri& uri, const StoreOptions& options) {
  switch (uri.backend) {
    case Backend::kSqlite: {
#if MODELDB_DB_SQLITE
      sqlite::SqliteOptions sqlite_options;
      sqlite_options.busy_timeout_ms = options.sqlite_busy_timeout_ms;
      sqlite_options.wal_mode        = options.sqlite_wal_mode;
      auto handle = std::make_shared<sqlite::SqliteDB>(uri.SqlitePath(), sqlite_options);
      return std::make_shared<sqlite::SqliteStore>(std::move(handle));
#else
      throw DeployError(ErrorKind::kInvalidArgument, "sqlite backend requested but not enabled at build time");
#endif
    }

    case Backend::kPostgres: {
#if MODELDB_DB_POSTGRES
      auto pool = std::make_shared<postgres::PgPool>(uri.LibpqConnectionString(), options.postgres_max_connections);
      return std::make_shared<postgres::PgStore>(std::move(pool));
#else
      throw DeployError(ErrorKind::kInvalidArgument, "postgres backend requested but not enabled at build time");
#endif
    }

    case Backend::kMemory:
      return std::make_shared<memory::MemoryStore>();
  }

  throw DeployError(ErrorKind::kInvalidArgument, "unsupported database uri: " + uri.Redacted());
}

CachingStoreProvider::CachingStoreProvider(StoreOptions options) : options_(options) {
}

std::shared_ptr<ModelStore> CachingStoreProvider::Open(const std::string& db_uri) {
  std::lock_guard lock(mutex_);

  auto it = stores_.find(db_uri);
  if (it != stores_.end()) {
    return it->second;
  }

  auto parsed = DatabaseUri::Parse(db_uri);
  auto store  = OpenStore(parsed, options_);
  MODELDB_LOG_INFO("Opened model store", {observability::StringField("uri", parsed.Redacted())});

  stores_.emplace(db_uri, store);
  return store;
}

} // namespace modeldb::db
