#include "factory.hpp"

#include <filesystem>

namespace modeldb::factory {

db::StoreOptions BuildStoreOptions(const modeldb::runtime::config::RuntimeConfig& config) {
  db::StoreOptions options;

  const auto& database = config.database();
  if (database.postgres().max_connections() > 0) {
    options.postgres_max_connections = database.postgres().max_connections();
  }
  if (database.sqlite().busy_timeout_ms() > 0) {
    options.sqlite_busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());
  }
  if (database.sqlite().has_wal_mode()) {
    options.sqlite_wal_mode = database.sqlite().wal_mode();
  }
  return options;
}

Runtime Build(const modeldb::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Collaborators outside the database
  // ------------------------------------------------------------------
  const std::filesystem::path registry_root =
      config.registry().root().empty() ? std::filesystem::current_path() : std::filesystem::path(config.registry().root());

  runtime.resolver  = std::make_shared<artifact::FileSystemRegistry>(registry_root);
  runtime.manifests = std::make_shared<artifact::YamlManifestLoader>();

  // ------------------------------------------------------------------
  // Database side
  // ------------------------------------------------------------------
  runtime.schemas = std::make_shared<db::schema::SchemaRegistry>();
  runtime.stores  = std::make_shared<db::CachingStoreProvider>(BuildStoreOptions(config));

  runtime.deployer = std::make_shared<deploy::Deployer>(runtime.resolver, runtime.manifests, runtime.schemas, runtime.stores);

  runtime.default_table = config.deployment().default_table().empty() ? deploy::kDefaultTable : config.deployment().default_table();
  return runtime;
}

} // namespace modeldb::factory
