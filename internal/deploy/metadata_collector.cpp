#include "internal/deploy/metadata_collector.hpp"

#include <fstream>
#include <iterator>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace modeldb::deploy {

using util::DeployError;
using util::ErrorKind;

namespace {

// sklearn artifacts written by MLflow name their file "pickled_model"
std::optional<std::string> DeclaredDataPath(const artifact::FlavorConfig& flavor) {
  if (auto data = flavor.Get("data")) return data;
  if (flavor.name == "sklearn") return flavor.Get("pickled_model");
  return std::nullopt;
}

std::string ReadPayload(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw DeployError(ErrorKind::kMissingArtifactData, "cannot open model data file " + path.string());
  }

  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw DeployError(ErrorKind::kMissingArtifactData, "failed reading model data file " + path.string());
  }
  return bytes;
}

} // namespace

std::filesystem::path FlavorDataPath(const artifact::ResolvedArtifact& artifact, const artifact::FlavorConfig& flavor) {
  auto declared = DeclaredDataPath(flavor);
  if (!declared || declared->empty()) {
    throw DeployError(ErrorKind::kMalformedFlavorConfig, "flavor `" + flavor.name + "` declares no data path");
  }

  const std::filesystem::path relative = std::filesystem::path(*declared).lexically_normal();
  if (relative.is_absolute() || relative.empty() || *relative.begin() == "..") {
    throw DeployError(ErrorKind::kMalformedFlavorConfig,
                      "flavor `" + flavor.name + "` data path must stay inside the model directory: " + *declared);
  }
  return artifact.local_path / relative;
}

db::model::DeployedModelRecord CollectMetadata(const artifact::ResolvedArtifact& artifact, const artifact::Manifest& manifest,
                                               const std::string& flavor, const CallerContext& caller) {
  const auto* config = manifest.FindFlavor(flavor);
  if (!config) {
    throw DeployError(ErrorKind::kFlavorNotPresent, "the model does not contain flavor `" + flavor + "`");
  }

  const auto version = config->Get(flavor + "_version");
  if (!version || version->empty()) {
    throw DeployError(ErrorKind::kMalformedFlavorConfig, "flavor `" + flavor + "` is missing `" + flavor + "_version`");
  }

  const auto data_path = FlavorDataPath(artifact, *config);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(data_path, ec)) {
    throw DeployError(ErrorKind::kMissingArtifactData, "model data file not found: " + data_path.string());
  }

  db::model::DeployedModelRecord record;
  record.model_name              = artifact.model_name;
  record.model_version           = artifact.model_version;
  record.model_framework         = flavor;
  record.model_framework_version = *version;
  record.model                   = ReadPayload(data_path);

  if (artifact.registry.creation_timestamp_ms) {
    record.model_creation_time = util::FromUnixMillis(*artifact.registry.creation_timestamp_ms);
  }
  record.model_description = artifact.registry.description;
  record.run_id            = artifact.registry.run_id ? artifact.registry.run_id : manifest.run_id;
  record.deployed_by       = caller.principal;
  return record;
}

} // namespace modeldb::deploy
