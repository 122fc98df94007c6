#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/model_store.hpp"
#include "internal/db/database_uri.hpp"

namespace modeldb::db {

struct StoreOptions {
  std::size_t postgres_max_connections = 4;
  int         sqlite_busy_timeout_ms   = 5000;
  bool        sqlite_wal_mode          = true;
};

/*
  Maps a connection URI to a store.

  The deployer asks for a store only after every pre-database check has
  passed, so a provider call is the first point at which a deployment can
  touch the database.
*/
class StoreProvider {
 public:
  virtual ~StoreProvider() = default;

  virtual std::shared_ptr<ModelStore> Open(const std::string& db_uri) = 0;
};

// Builds a store for one URI. Throws util::DeployError(kInvalidArgument)
// for backends that were not compiled in.
std::shared_ptr<ModelStore> OpenStore(const DatabaseUri& uri, const StoreOptions& options);

/*
  One store per distinct URI for the process lifetime, so postgres pools
  and sqlite handles are reused across deployments.
*/
class CachingStoreProvider final : public StoreProvider {
 public:
  explicit CachingStoreProvider(StoreOptions options = {});

  std::shared_ptr<ModelStore> Open(const std::string& db_uri) override;

 private:
  StoreOptions options_;

  std::mutex                                                   mutex_;
  std::unordered_map<std::string, std::shared_ptr<ModelStore>> stores_;
};

} // namespace modeldb::db
