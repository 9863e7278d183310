#pragma once

#include <string>
#include <vector>

namespace pagereg::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

// Ordered schema statements for the page registry. Every statement is
// idempotent so running them against an existing database is harmless.
const std::vector<std::string>& RegistrySchema();

/*
  Runs migrations in order.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace pagereg::db::sql
