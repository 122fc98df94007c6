#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/artifact/artifact_resolver.hpp"
#include "internal/artifact/manifest.hpp"
#include "internal/db/schema/schema_registry.hpp"
#include "internal/db/store_provider.hpp"
#include "internal/deploy/deployer.hpp"

namespace modeldb::factory {

/*
  Runtime

  Owns all long-lived objects used by the CLI.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<artifact::ArtifactResolver>     resolver;
  std::shared_ptr<const artifact::ManifestLoader> manifests;
  std::shared_ptr<db::schema::SchemaRegistry>     schemas;
  std::shared_ptr<db::StoreProvider>              stores;
  std::shared_ptr<deploy::Deployer>               deployer;

  // deployment.default_table, or "models"
  std::string default_table;
};

db::StoreOptions BuildStoreOptions(const modeldb::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the whole dependency graph from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete resolver and store types.
*/
Runtime Build(const modeldb::runtime::config::RuntimeConfig& config);

} // namespace modeldb::factory
