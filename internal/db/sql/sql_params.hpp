#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"

namespace modeldb::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so a schema renders its values once and each
  backend binds them positionally. Blob and text columns both travel as
  std::string; the column type decides how the backend binds them.
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    std::string,
    util::TimePoint
>;

using Params = std::vector<Param>;

} // namespace modeldb::db::sql
