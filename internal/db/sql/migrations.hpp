#pragma once

#include <string>
#include <vector>

namespace pagewise::db::sql {

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
  Ordered schema statements for the progress / ledger tables.
  Every statement is idempotent (IF NOT EXISTS).
*/
const std::vector<std::string>& SchemaStatements();

/*
  Runs migrations in order.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace pagewise::db::sql
