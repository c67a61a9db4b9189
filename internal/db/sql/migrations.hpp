#pragma once

#include <string>
#include <vector>

namespace kbsync::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Ledger schema, in application order.

  Every statement is idempotent (IF NOT EXISTS) so it is safe to run on
  each start against a ledger that other processes already use.
*/
const std::vector<std::string>& LedgerSchema();

/*
  Runs migrations in order.
  Stops at the first failing statement (the executor throws).
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace kbsync::db::sql
