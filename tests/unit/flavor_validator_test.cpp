#include "internal/deploy/flavor_validator.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using modeldb::artifact::FlavorConfig;
using modeldb::artifact::Manifest;
using modeldb::deploy::ValidateFlavor;
using modeldb::util::DeployError;
using modeldb::util::ErrorKind;

Manifest WithFlavors(std::initializer_list<const char*> names) {
  Manifest manifest;
  for (const auto* name : names) {
    manifest.flavors.push_back(FlavorConfig{name, {}});
  }
  return manifest;
}

std::string ExpectKind(const std::function<void()>& fn, ErrorKind expected) {
  try {
    fn();
  } catch (const DeployError& e) {
    assert(e.kind() == expected);
    return e.what();
  }
  assert(false && "expected DeployError");
  return {};
}

void TestRequestedFlavorMustBeSupported() {
  const auto manifest = WithFlavors({"tensorflow", "onnx"});
  const auto message  = ExpectKind([&] { ValidateFlavor(manifest, std::string("tensorflow")); }, ErrorKind::kUnsupportedFlavor);
  assert(message.find("tensorflow") != std::string::npos);
  assert(message.find("onnx") != std::string::npos);
  assert(message.find("sklearn") != std::string::npos);
}

void TestRequestedFlavorMustBeInManifest() {
  const auto manifest = WithFlavors({"python_function", "onnx"});
  const auto message  = ExpectKind([&] { ValidateFlavor(manifest, std::string("sklearn")); }, ErrorKind::kFlavorNotPresent);
  assert(message.find("python_function") != std::string::npos);
}

void TestRequestedFlavorAccepted() {
  const auto manifest = WithFlavors({"python_function", "sklearn", "onnx"});
  assert(ValidateFlavor(manifest, std::string("onnx")) == "onnx");
  assert(ValidateFlavor(manifest, std::string("sklearn")) == "sklearn");
}

void TestAutoDetectFollowsDocumentOrder() {
  assert(ValidateFlavor(WithFlavors({"python_function", "sklearn", "onnx"}), std::nullopt) == "sklearn");
  assert(ValidateFlavor(WithFlavors({"onnx", "sklearn"}), std::nullopt) == "onnx");
  assert(ValidateFlavor(WithFlavors({"pytorch", "onnx"}), std::nullopt) == "onnx");
}

void TestAutoDetectWithoutSupportedFlavor() {
  ExpectKind([] { ValidateFlavor(WithFlavors({"python_function", "pytorch"}), std::nullopt); }, ErrorKind::kUnsupportedFlavor);
  ExpectKind([] { ValidateFlavor(WithFlavors({}), std::nullopt); }, ErrorKind::kUnsupportedFlavor);
}

void TestFlavorNamesAreCaseSensitive() {
  ExpectKind([] { ValidateFlavor(WithFlavors({"ONNX"}), std::string("ONNX")); }, ErrorKind::kUnsupportedFlavor);
  assert(!modeldb::deploy::IsSupportedFlavor("Sklearn"));
  assert(modeldb::deploy::IsSupportedFlavor("sklearn"));
}

} // namespace

int main() {
  TestRequestedFlavorMustBeSupported();
  TestRequestedFlavorMustBeInManifest();
  TestRequestedFlavorAccepted();
  TestAutoDetectFollowsDocumentOrder();
  TestAutoDetectWithoutSupportedFlavor();
  TestFlavorNamesAreCaseSensitive();

  std::cout << "modeldb_unit_flavor_validator: pass\n";
  return 0;
}
