#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "internal/artifact/artifact_resolver.hpp"
#include "internal/artifact/manifest.hpp"
#include "internal/db/model/deployed_model_record.hpp"

namespace modeldb::deploy {

// Caller-supplied fields of the row.
struct CallerContext {
  std::optional<int64_t> principal;
};

// Data file of the flavor, under the artifact root. Throws
// kMalformedFlavorConfig when the flavor declares no usable path.
std::filesystem::path FlavorDataPath(const artifact::ResolvedArtifact& artifact, const artifact::FlavorConfig& flavor);

/*
  Builds the row draft for an already validated flavor.

  Reads the data file fully; its bytes are stored as is. Leaves model_id
  and model_deployment_time unset, those belong to the insert.

  Throws DeployError kMissingArtifactData / kMalformedFlavorConfig.
*/
db::model::DeployedModelRecord CollectMetadata(const artifact::ResolvedArtifact& artifact, const artifact::Manifest& manifest,
                                               const std::string& flavor, const CallerContext& caller);

} // namespace modeldb::deploy
