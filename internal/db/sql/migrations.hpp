#pragma once

#include <string>
#include <vector>

namespace permit::db::sql {

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
  Runs migrations in order. Statements must be idempotent
  (CREATE ... IF NOT EXISTS) since they run on every startup.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// The permission_change schema from sql_queries.hpp.
std::vector<std::string> PermissionChangeSchema();

} // namespace permit::db::sql
