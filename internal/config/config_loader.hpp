#pragma once

#include <string>

#include "config/config.pb.h"

namespace modeldb::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  and type mismatches are rejected by the protobuf JSON parser.
*/
class ConfigLoader {
 public:
  static modeldb::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error on values protobuf cannot express as invalid
  // (unknown log level).
  static void Validate(const modeldb::runtime::config::RuntimeConfig& config);
};

} // namespace modeldb::config
