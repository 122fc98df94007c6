#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace modeldb::db::model {

/*
  One deployed artifact row.

  IMPORTANT:
  - model_id is assigned by the store on insert (0 = not yet inserted).
  - model_deployment_time is stamped inside the inserting transaction,
    never by the metadata collector.
  - Write-once: nothing updates a row after commit.
*/

struct DeployedModelRecord {
  int64_t model_id = 0;

  std::string model_name;
  std::string model_version;
  std::string model_framework;
  std::string model_framework_version;

  // opaque artifact bytes
  std::string model;

  std::optional<util::TimePoint> model_creation_time;
  std::optional<util::TimePoint> model_deployment_time;

  std::optional<int64_t>     deployed_by;
  std::optional<std::string> model_description;
  std::optional<std::string> run_id;
};

} // namespace modeldb::db::model
