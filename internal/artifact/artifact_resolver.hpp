#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace modeldb::artifact {

// models:/<name>/<version>
struct ModelRef {
  std::string name;
  std::string version; // number or stage label

  // Throws DeployError(kInvalidArgument).
  static ModelRef Parse(const std::string& uri);

  std::string ToString() const;
};

// Provenance the registry keeps per model version.
struct RegistryMetadata {
  std::optional<int64_t>     creation_timestamp_ms;
  std::optional<std::string> description;
  std::optional<std::string> run_id;
};

struct ResolvedArtifact {
  std::filesystem::path local_path;
  std::string           model_name;
  std::string           model_version;
  RegistryMetadata      registry;
};

class ArtifactResolver {
 public:
  virtual ~ArtifactResolver() = default;

  virtual ResolvedArtifact Resolve(const std::string& model_ref) = 0;
};

/*
  Registry laid out on a local or mounted filesystem:

    <root>/<name>/<version>/MLmodel
    <root>/<name>/<version>/<data files>
    <root>/<name>/<version>/registry.yaml   (optional)

  registry.yaml keys: creation_timestamp (ms since epoch), description,
  run_id.
*/
class FileSystemRegistry final : public ArtifactResolver {
 public:
  explicit FileSystemRegistry(std::filesystem::path root);

  ResolvedArtifact Resolve(const std::string& model_ref) override;

 private:
  RegistryMetadata ReadMetadata(const std::filesystem::path& version_dir) const;

  std::filesystem::path root_;
};

} // namespace modeldb::artifact
