#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace archstore::db::sql {

/*
  Parameter abstraction.

  SQLite binds ? placeholders in order; query builders collect params
  alongside the SQL text and the backend binds them in one pass.
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

struct Statement {
  std::string sql;
  Params params;
};

}
