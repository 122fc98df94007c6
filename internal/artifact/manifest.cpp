#include "internal/artifact/manifest.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

namespace modeldb::artifact {

using util::DeployError;
using util::ErrorKind;

namespace {

std::optional<std::string> TopLevelScalar(const YAML::Node& root, const char* key) {
  const auto node = root[key];
  if (!node || !node.IsScalar()) return std::nullopt;
  return node.Scalar();
}

} // namespace

std::optional<std::string> FlavorConfig::Get(const std::string& key) const {
  auto it = attributes.find(key);
  if (it == attributes.end()) return std::nullopt;
  return it->second;
}

const FlavorConfig* Manifest::FindFlavor(std::string_view name) const {
  for (const auto& flavor : flavors) {
    if (flavor.name == name) return &flavor;
  }
  return nullptr;
}

std::vector<std::string> Manifest::FlavorNames() const {
  std::vector<std::string> names;
  names.reserve(flavors.size());
  for (const auto& flavor : flavors) names.push_back(flavor.name);
  return names;
}

Manifest YamlManifestLoader::Parse(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw DeployError(ErrorKind::kMalformedFlavorConfig, "manifest is not valid YAML: " + std::string(e.what()));
  }

  if (!root.IsMap()) {
    throw DeployError(ErrorKind::kMalformedFlavorConfig, "manifest must be a mapping");
  }

  const auto flavors = root["flavors"];
  if (!flavors || !flavors.IsMap()) {
    throw DeployError(ErrorKind::kMalformedFlavorConfig, "manifest has no 'flavors' mapping");
  }

  Manifest manifest;
  // yaml-cpp keeps mappings in document order
  for (const auto& entry : flavors) {
    FlavorConfig flavor;
    flavor.name = entry.first.Scalar();

    if (entry.second.IsMap()) {
      for (const auto& attribute : entry.second) {
        if (attribute.second.IsScalar()) {
          flavor.attributes.emplace(attribute.first.Scalar(), attribute.second.Scalar());
        }
      }
    } else if (!entry.second.IsNull()) {
      throw DeployError(ErrorKind::kMalformedFlavorConfig, "flavor '" + flavor.name + "' must be a mapping");
    }

    manifest.flavors.push_back(std::move(flavor));
  }

  manifest.run_id = TopLevelScalar(root, "run_id");
  return manifest;
}

Manifest YamlManifestLoader::Load(const std::filesystem::path& local_path) const {
  const auto path = local_path / kManifestFileName;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw DeployError(ErrorKind::kManifestNotFound,
                      "failed to find " + std::string(kManifestFileName) + " within model root " + local_path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw DeployError(ErrorKind::kManifestNotFound, "cannot open manifest " + path.string());
  }
  std::ostringstream text;
  text << in.rdbuf();

  return Parse(text.str());
}

} // namespace modeldb::artifact
