#include "internal/deploy/deployer.hpp"

#include <algorithm>

#include "internal/deploy/flavor_validator.hpp"
#include "internal/deploy/metadata_collector.hpp"
#include "internal/deploy/transaction_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace modeldb::deploy {

using observability::IntField;
using observability::StringField;
using util::DeployError;
using util::ErrorKind;

Deployer::Deployer(std::shared_ptr<artifact::ArtifactResolver> resolver,
                   std::shared_ptr<const artifact::ManifestLoader> manifests,
                   std::shared_ptr<db::schema::SchemaRegistry> schemas,
                   std::shared_ptr<db::StoreProvider> stores)
    : resolver_(std::move(resolver)),
      manifests_(std::move(manifests)),
      schemas_(std::move(schemas)),
      stores_(std::move(stores)) {
}

DeployReceipt Deployer::Deploy(const DeployRequest& request) {
  MODELDB_LOG_INFO("Deploying model", {StringField("model", request.model_ref), StringField("table", request.table_name)});

  try {
    try {
      auto receipt = Execute(request);
      MODELDB_LOG_INFO("Deployed model",
                       {StringField("model", request.model_ref), StringField("table", receipt.table_name),
                        IntField("model_id", receipt.model_id), StringField("flavor", receipt.flavor),
                        IntField("bytes", static_cast<std::int64_t>(receipt.artifact_bytes)),
                        IntField("deployed_at_ms", util::ToUnixMillis(receipt.deployment_time))});
      return receipt;
    } catch (const DeployError&) {
      throw;
    } catch (...) {
      util::ThrowWrapped(ErrorKind::kInternal, "deployment of " + request.model_ref + " failed");
    }
  } catch (const DeployError& e) {
    MODELDB_LOG_ERROR("Deployment failed", {StringField("model", request.model_ref),
                                            StringField("kind", util::ErrorKindName(e.kind())), StringField("error", e.what())});
    throw;
  }
}

DeployReceipt Deployer::Execute(const DeployRequest& request) {
  // ------------------------------------------------------------------
  // Read-only phase: no database contact
  // ------------------------------------------------------------------
  const auto artifact = resolver_->Resolve(request.model_ref);
  const auto manifest = manifests_->Load(artifact.local_path);
  const auto flavor   = ValidateFlavor(manifest, request.flavor);

  auto record = CollectMetadata(artifact, manifest, flavor, CallerContext{request.principal});

  // ------------------------------------------------------------------
  // Write phase: one managed transaction
  // ------------------------------------------------------------------
  auto store = stores_->Open(request.db_uri);

  TransactionManager transactions(*store);
  const auto deployment_time = transactions.WithTransaction([&](db::Transaction& tx) {
    auto schema = schemas_->GetOrCreate(*store, tx, request.table_name);

    // registry clocks can run ahead of ours
    auto now = util::Now();
    if (record.model_creation_time) {
      now = std::max(now, *record.model_creation_time);
    }
    record.model_deployment_time = now;

    db::ThrowIfDbError(store->InsertModel(tx, *schema, record), "insert into " + request.table_name);
    return now;
  });

  DeployReceipt receipt;
  receipt.model_id        = record.model_id;
  receipt.table_name      = request.table_name;
  receipt.model_name      = record.model_name;
  receipt.model_version   = record.model_version;
  receipt.flavor          = record.model_framework;
  receipt.flavor_version  = record.model_framework_version;
  receipt.artifact_bytes  = record.model.size();
  receipt.deployment_time = deployment_time;
  return receipt;
}

} // namespace modeldb::deploy
