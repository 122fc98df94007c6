#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/artifact/artifact_resolver.hpp"
#include "internal/artifact/manifest.hpp"
#include "internal/db/schema/schema_registry.hpp"
#include "internal/db/store_provider.hpp"
#include "internal/util/time.hpp"

namespace modeldb::deploy {

inline constexpr const char* kDefaultTable = "models";

struct DeployRequest {
  std::string                model_ref; // models:/<name>/<version>
  std::string                db_uri;
  std::optional<int64_t>     principal;
  std::optional<std::string> flavor; // unset = auto-detect
  std::string                table_name = kDefaultTable;
};

struct DeployReceipt {
  int64_t         model_id = 0;
  std::string     table_name;
  std::string     model_name;
  std::string     model_version;
  std::string     flavor;
  std::string     flavor_version;
  std::size_t     artifact_bytes = 0;
  util::TimePoint deployment_time{};
};

/*
  Deployer

  resolve -> load manifest -> validate flavor -> collect metadata
          -> open store -> [ ensure table -> stamp -> insert ] commit

  Everything before "open store" is read-only and runs without a database
  connection; a failure there never reaches the store. The bracketed part
  is one managed transaction.

  Every failure leaves as a util::DeployError.
*/
class Deployer {
 public:
  Deployer(std::shared_ptr<artifact::ArtifactResolver> resolver,
           std::shared_ptr<const artifact::ManifestLoader> manifests,
           std::shared_ptr<db::schema::SchemaRegistry> schemas,
           std::shared_ptr<db::StoreProvider> stores);

  DeployReceipt Deploy(const DeployRequest& request);

 private:
  DeployReceipt Execute(const DeployRequest& request);

  std::shared_ptr<artifact::ArtifactResolver>     resolver_;
  std::shared_ptr<const artifact::ManifestLoader> manifests_;
  std::shared_ptr<db::schema::SchemaRegistry>     schemas_;
  std::shared_ptr<db::StoreProvider>              stores_;
};

} // namespace modeldb::deploy
