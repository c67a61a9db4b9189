#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace kbsync::db::sql {

/*
  Parameter abstraction for the canonical queries in sql_queries.hpp.

  Positional "?" binding; nullptr binds SQL NULL.
*/

using Param = std::variant<std::nullptr_t, int64_t, double, std::string>;

using Params = std::vector<Param>;

} // namespace kbsync::db::sql
