#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "internal/artifact/manifest.hpp"

namespace modeldb::deploy {

// Flavors a model table can hold, in auto-detect preference order.
inline constexpr std::array<std::string_view, 2> kSupportedFlavors = {"onnx", "sklearn"};

bool IsSupportedFlavor(std::string_view flavor);

/*
  Picks the flavor to deploy. Pure: no I/O.

  requested set:   must be supported (kUnsupportedFlavor) and listed by
                   the manifest (kFlavorNotPresent).
  requested unset: first manifest flavor, in document order, that is
                   supported; kUnsupportedFlavor when there is none.
*/
std::string ValidateFlavor(const artifact::Manifest& manifest, const std::optional<std::string>& requested);

} // namespace modeldb::deploy
