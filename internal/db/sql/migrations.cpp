#include "internal/db/sql/migrations.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace permit::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

std::vector<std::string> PermissionChangeSchema() {
  return {SCHEMA_MIGRATIONS.begin(), SCHEMA_MIGRATIONS.end()};
}

} // namespace permit::db::sql
