#pragma once

#include <string>
#include <vector>

namespace sandbox::db::sql {

// Sink for schema statements; SqliteDB implements it, PgPool::Migrate
// runs the Postgres list inside one transaction instead.
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

/*
  Schema for jobs, queue_settings, ports and projects. Statements use
  IF NOT EXISTS and are applied in order on every start. Timestamps are
  unix milliseconds in both dialects.
*/
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace sandbox::db::sql
