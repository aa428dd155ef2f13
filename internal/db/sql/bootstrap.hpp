#pragma once

#include <string>
#include <vector>

namespace archstore::db::sql {

/*
  Backend-agnostic DDL execution.

  Each backend implements ExecuteSQL().
*/

class DdlExecutor {
 public:
  virtual ~DdlExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs statements in order. Every statement must be idempotent
  (CREATE ... IF NOT EXISTS) so bootstrap can run on every open.
*/
void RunBootstrap(DdlExecutor& executor, const std::vector<std::string>& ordered_sql);

// Tables, indexes and column checks for the record store layout.
const std::vector<std::string>& StoreLayoutDdl();
const std::vector<std::string>& StoreLayoutChecks();

} // namespace archstore::db::sql
