#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace modeldb::artifact {

inline constexpr const char* kManifestFileName = "MLmodel";

/*
  One flavor section of a manifest.

  Only scalar keys are kept; nested sections (env, signatures, ...) are
  not needed for deployment.
*/
struct FlavorConfig {
  std::string                                  name;
  std::unordered_map<std::string, std::string> attributes;

  std::optional<std::string> Get(const std::string& key) const;
};

struct Manifest {
  // document order
  std::vector<FlavorConfig> flavors;

  std::optional<std::string> run_id;

  const FlavorConfig*      FindFlavor(std::string_view name) const;
  std::vector<std::string> FlavorNames() const;
};

class ManifestLoader {
 public:
  virtual ~ManifestLoader() = default;

  // Reads <local_path>/MLmodel.
  virtual Manifest Load(const std::filesystem::path& local_path) const = 0;
};

class YamlManifestLoader final : public ManifestLoader {
 public:
  // Throws DeployError: kManifestNotFound when the file is missing,
  // kMalformedFlavorConfig when it does not parse.
  Manifest Load(const std::filesystem::path& local_path) const override;

  static Manifest Parse(const std::string& yaml_text);
};

} // namespace modeldb::artifact
