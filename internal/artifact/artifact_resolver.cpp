#include "internal/artifact/artifact_resolver.hpp"

#include <yaml-cpp/yaml.h>

#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"

namespace modeldb::artifact {

using util::DeployError;
using util::ErrorKind;

namespace {

constexpr std::string_view kScheme       = "models:/";
constexpr const char*      kRegistryFile = "registry.yaml";

bool IsSafeSegment(const std::string& segment) {
  return !segment.empty() && segment != "." && segment != ".." && segment.find('\\') == std::string::npos;
}

std::optional<std::string> OptionalScalar(const YAML::Node& root, const char* key) {
  const auto node = root[key];
  if (!node || !node.IsScalar()) return std::nullopt;
  return node.Scalar();
}

} // namespace

ModelRef ModelRef::Parse(const std::string& uri) {
  if (uri.compare(0, kScheme.size(), kScheme) != 0) {
    throw DeployError(ErrorKind::kInvalidArgument, "model reference must look like models:/<name>/<version>, got '" + uri + "'");
  }

  std::vector<std::string> segments;
  std::string              rest = uri.substr(kScheme.size());
  std::size_t              start = 0;
  for (;;) {
    auto slash = rest.find('/', start);
    segments.push_back(rest.substr(start, slash - start));
    if (slash == std::string::npos) break;
    start = slash + 1;
  }

  if (segments.size() != 2 || !IsSafeSegment(segments[0]) || !IsSafeSegment(segments[1])) {
    throw DeployError(ErrorKind::kInvalidArgument, "model reference must look like models:/<name>/<version>, got '" + uri + "'");
  }

  return ModelRef{segments[0], segments[1]};
}

std::string ModelRef::ToString() const {
  return std::string(kScheme) + name + "/" + version;
}

FileSystemRegistry::FileSystemRegistry(std::filesystem::path root) : root_(std::move(root)) {
}

ResolvedArtifact FileSystemRegistry::Resolve(const std::string& model_ref) {
  const auto ref         = ModelRef::Parse(model_ref);
  const auto version_dir = root_ / ref.name / ref.version;

  std::error_code ec;
  if (!std::filesystem::is_directory(version_dir, ec)) {
    throw DeployError(ErrorKind::kModelNotFound,
                      "registered model " + ref.name + " version " + ref.version + " not found under " + root_.string());
  }

  ResolvedArtifact resolved;
  resolved.local_path    = version_dir;
  resolved.model_name    = ref.name;
  resolved.model_version = ref.version;
  resolved.registry      = ReadMetadata(version_dir);
  return resolved;
}

RegistryMetadata FileSystemRegistry::ReadMetadata(const std::filesystem::path& version_dir) const {
  RegistryMetadata metadata;

  const auto path = version_dir / kRegistryFile;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return metadata;
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    throw DeployError(ErrorKind::kInvalidArgument, "unreadable registry metadata " + path.string() + ": " + e.what());
  }
  if (!root.IsMap()) {
    return metadata;
  }

  if (auto ts = OptionalScalar(root, "creation_timestamp")) {
    try {
      std::size_t consumed = 0;
      metadata.creation_timestamp_ms = std::stoll(*ts, &consumed);
      if (consumed != ts->size()) throw std::invalid_argument(*ts);
    } catch (const std::exception&) {
      throw DeployError(ErrorKind::kInvalidArgument, "creation_timestamp in " + path.string() + " is not an integer: " + *ts);
    }
  }
  metadata.description = OptionalScalar(root, "description");
  metadata.run_id      = OptionalScalar(root, "run_id");
  return metadata;
}

} // namespace modeldb::artifact
