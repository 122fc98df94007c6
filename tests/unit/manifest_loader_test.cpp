#include "internal/artifact/manifest.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using modeldb::artifact::YamlManifestLoader;
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

void TestParsesFlavorsInDocumentOrder() {
  const auto manifest = YamlManifestLoader::Parse(R"(artifact_path: model
run_id: 8a7b6c
utc_time_created: '2024-03-01 10:15:00.000000'
flavors:
  python_function:
    env:
      conda: conda.yaml
    loader_module: mlflow.sklearn
  sklearn:
    sklearn_version: 1.3.2
    pickled_model: model.pkl
    serialization_format: cloudpickle
  onnx:
    onnx_version: 1.10
    data: model.onnx
)");

  assert(manifest.FlavorNames() == (std::vector<std::string>{"python_function", "sklearn", "onnx"}));
  assert(manifest.run_id == std::string("8a7b6c"));

  const auto* onnx = manifest.FindFlavor("onnx");
  assert(onnx != nullptr);
  // scalars keep their source text
  assert(onnx->Get("onnx_version") == std::string("1.10"));
  assert(onnx->Get("data") == std::string("model.onnx"));

  const auto* pyfunc = manifest.FindFlavor("python_function");
  assert(pyfunc->Get("env") == std::nullopt);
  assert(pyfunc->Get("loader_module") == std::string("mlflow.sklearn"));

  assert(manifest.FindFlavor("tensorflow") == nullptr);
}

void TestFlavorWithoutBody() {
  const auto manifest = YamlManifestLoader::Parse("flavors:\n  onnx:\n");
  assert(manifest.flavors.size() == 1);
  assert(manifest.flavors[0].attributes.empty());
  assert(!manifest.run_id.has_value());
}

void TestMalformedManifests() {
  ExpectKind([] { YamlManifestLoader::Parse("flavors: [onnx"); }, ErrorKind::kMalformedFlavorConfig);
  ExpectKind([] { YamlManifestLoader::Parse("- just\n- a list\n"); }, ErrorKind::kMalformedFlavorConfig);
  ExpectKind([] { YamlManifestLoader::Parse("run_id: abc\n"); }, ErrorKind::kMalformedFlavorConfig);
  ExpectKind([] { YamlManifestLoader::Parse("flavors:\n  - onnx\n"); }, ErrorKind::kMalformedFlavorConfig);
  ExpectKind([] { YamlManifestLoader::Parse("flavors:\n  onnx: 1.10\n"); }, ErrorKind::kMalformedFlavorConfig);
}

void TestLoadFromDirectory() {
  const auto dir = std::filesystem::temp_directory_path() / "modeldb_manifest_loader_tests" / "model";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  YamlManifestLoader loader;
  ExpectKind([&] { loader.Load(dir); }, ErrorKind::kManifestNotFound);
  ExpectKind([&] { loader.Load(dir / "missing"); }, ErrorKind::kManifestNotFound);

  {
    std::ofstream out(dir / "MLmodel");
    out << "flavors:\n  onnx:\n    onnx_version: '1.14'\n    data: model.onnx\n";
  }
  const auto manifest = loader.Load(dir);
  assert(manifest.FindFlavor("onnx")->Get("onnx_version") == std::string("1.14"));
}

} // namespace

int main() {
  TestParsesFlavorsInDocumentOrder();
  TestFlavorWithoutBody();
  TestMalformedManifests();
  TestLoadFromDirectory();

  std::cout << "modeldb_unit_manifest_loader: pass\n";
  return 0;
}
