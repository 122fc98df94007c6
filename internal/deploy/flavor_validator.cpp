#include "internal/deploy/flavor_validator.hpp"

#include <algorithm>
#include <vector>

#include "internal/util/errors.hpp"

namespace modeldb::deploy {

using util::DeployError;
using util::ErrorKind;

namespace {

template <typename Range>
std::string JoinNames(const Range& names) {
  std::string out = "[";
  bool first = true;
  for (const auto& name : names) {
    if (!first) out += ", ";
    first = false;
    out += name;
  }
  return out + "]";
}

} // namespace

bool IsSupportedFlavor(std::string_view flavor) {
  return std::find(kSupportedFlavors.begin(), kSupportedFlavors.end(), flavor) != kSupportedFlavors.end();
}

std::string ValidateFlavor(const artifact::Manifest& manifest, const std::optional<std::string>& requested) {
  if (requested) {
    if (!IsSupportedFlavor(*requested)) {
      throw DeployError(ErrorKind::kUnsupportedFlavor, "flavor `" + *requested + "` is not supported for deployment. Please use one of the supported flavors: " +
                                                           JoinNames(kSupportedFlavors));
    }
    if (!manifest.FindFlavor(*requested)) {
      throw DeployError(ErrorKind::kFlavorNotPresent, "the model does not contain flavor `" + *requested +
                                                          "`; available flavors: " + JoinNames(manifest.FlavorNames()));
    }
    return *requested;
  }

  for (const auto& flavor : manifest.flavors) {
    if (IsSupportedFlavor(flavor.name)) {
      return flavor.name;
    }
  }

  throw DeployError(ErrorKind::kUnsupportedFlavor, "the model flavors: " + JoinNames(manifest.FlavorNames()) +
                                                       " are not supported for deployment. Please use one of the supported flavors: " +
                                                       JoinNames(kSupportedFlavors));
}

} // namespace modeldb::deploy
