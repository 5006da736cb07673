#pragma once

#include <string>
#include <vector>

namespace roadcast::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL(). Statements are idempotent
  (IF NOT EXISTS), so running them at every start-up is safe.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace roadcast::db::sql
