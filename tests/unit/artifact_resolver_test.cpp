#include "internal/artifact/artifact_resolver.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using modeldb::artifact::FileSystemRegistry;
using modeldb::artifact::ModelRef;
using modeldb::util::DeployError;
using modeldb::util::ErrorKind;

void ExpectKind(const std::function<void()>& fn, ErrorKind expected) {
  try {
    fn();
  } catch (const DeployError& e) {
    assert(e.kind() == expected);
    return;
  }
  assert(false && "expected DeployError");
}

std::filesystem::path RegistryRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "modeldb_artifact_resolver_tests" / test_name;
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  return root;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path);
  out << content;
}

void TestModelRefParsing() {
  auto ref = ModelRef::Parse("models:/fraud-detector/3");
  assert(ref.name == "fraud-detector");
  assert(ref.version == "3");
  assert(ref.ToString() == "models:/fraud-detector/3");

  ref = ModelRef::Parse("models:/churn/Production");
  assert(ref.version == "Production");

  for (const char* bad : {"", "models:/", "models:/only-name", "models:/a/b/c", "models://a/1", "runs:/abc/model",
                          "models:/../1", "models:/a/..", "models:/a\\b/1"}) {
    ExpectKind([&] { ModelRef::Parse(bad); }, ErrorKind::kInvalidArgument);
  }
}

void TestResolveWithoutRegistryMetadata() {
  const auto root = RegistryRoot("plain");
  std::filesystem::create_directories(root / "churn" / "7");

  FileSystemRegistry registry(root);
  const auto         resolved = registry.Resolve("models:/churn/7");
  assert(resolved.local_path == root / "churn" / "7");
  assert(resolved.model_name == "churn");
  assert(resolved.model_version == "7");
  assert(!resolved.registry.creation_timestamp_ms.has_value());
  assert(!resolved.registry.description.has_value());
  assert(!resolved.registry.run_id.has_value());
}

void TestResolveReadsRegistryMetadata() {
  const auto root = RegistryRoot("metadata");
  WriteFile(root / "churn" / "7" / "registry.yaml",
            "creation_timestamp: 1712345678901\ndescription: weekly retrain\nrun_id: r-123\n");

  FileSystemRegistry registry(root);
  const auto         resolved = registry.Resolve("models:/churn/7");
  assert(resolved.registry.creation_timestamp_ms == 1712345678901LL);
  assert(resolved.registry.description == std::string("weekly retrain"));
  assert(resolved.registry.run_id == std::string("r-123"));
}

void TestResolveFailures() {
  const auto root = RegistryRoot("failures");
  FileSystemRegistry registry(root);

  ExpectKind([&] { registry.Resolve("models:/churn/1"); }, ErrorKind::kModelNotFound);

  WriteFile(root / "churn" / "1", "not a directory");
  ExpectKind([&] { registry.Resolve("models:/churn/1"); }, ErrorKind::kModelNotFound);

  WriteFile(root / "bad-ts" / "1" / "registry.yaml", "creation_timestamp: yesterday\n");
  ExpectKind([&] { registry.Resolve("models:/bad-ts/1"); }, ErrorKind::kInvalidArgument);

  WriteFile(root / "bad-yaml" / "1" / "registry.yaml", "description: [unterminated\n");
  ExpectKind([&] { registry.Resolve("models:/bad-yaml/1"); }, ErrorKind::kInvalidArgument);
}

} // namespace

int main() {
  TestModelRefParsing();
  TestResolveWithoutRegistryMetadata();
  TestResolveReadsRegistryMetadata();
  TestResolveFailures();

  std::cout << "modeldb_unit_artifact_resolver: pass\n";
  return 0;
}
