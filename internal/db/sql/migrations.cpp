#include "migrations.hpp"

namespace sandbox::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS jobs ("
      " id TEXT PRIMARY KEY,"
      " type TEXT NOT NULL,"
      " state TEXT NOT NULL CHECK (state IN ('queued','running','succeeded','failed','cancelled')),"
      " project_id TEXT,"
      " payload_json TEXT NOT NULL DEFAULT '{}',"
      " priority INTEGER NOT NULL DEFAULT 0,"
      " attempts INTEGER NOT NULL DEFAULT 0,"
      " max_attempts INTEGER NOT NULL DEFAULT 3,"
      " run_at INTEGER NOT NULL,"
      " locked_at INTEGER,"
      " lock_expires_at INTEGER,"
      " locked_by TEXT,"
      " dedupe_key TEXT,"
      " dedupe_active TEXT,"
      " cancel_requested_at INTEGER,"
      " cancelled_at INTEGER,"
      " last_error TEXT,"
      " created_at INTEGER NOT NULL,"
      " updated_at INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS jobs_state_run_at_idx ON jobs(state, run_at);",
      "CREATE INDEX IF NOT EXISTS jobs_project_idx ON jobs(project_id);",
      "CREATE UNIQUE INDEX IF NOT EXISTS jobs_dedupe_active_idx ON jobs(dedupe_key, dedupe_active);",
      "CREATE TABLE IF NOT EXISTS queue_settings ("
      " id INTEGER PRIMARY KEY CHECK (id = 1),"
      " paused INTEGER NOT NULL DEFAULT 0,"
      " concurrency INTEGER NOT NULL DEFAULT 2 CHECK (concurrency BETWEEN 1 AND 20),"
      " updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ports ("
      " port INTEGER PRIMARY KEY,"
      " port_type TEXT NOT NULL CHECK (port_type IN ('base','version','dev')),"
      " project_id TEXT,"
      " hash TEXT,"
      " created_at INTEGER NOT NULL,"
      " updated_at INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ports_project_idx ON ports(project_id);",
      "CREATE TABLE IF NOT EXISTS projects ("
      " id TEXT PRIMARY KEY,"
      " name TEXT NOT NULL,"
      " path_on_disk TEXT NOT NULL,"
      " status TEXT NOT NULL,"
      " dev_port INTEGER,"
      " runtime_port INTEGER,"
      " production_status TEXT NOT NULL DEFAULT 'stopped',"
      " production_hash TEXT,"
      " production_port INTEGER,"
      " production_url TEXT,"
      " production_error TEXT,"
      " production_started_at INTEGER,"
      " created_at INTEGER NOT NULL,"
      " updated_at INTEGER NOT NULL);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS jobs ("
      " id TEXT PRIMARY KEY,"
      " type TEXT NOT NULL,"
      " state TEXT NOT NULL CHECK (state IN ('queued','running','succeeded','failed','cancelled')),"
      " project_id TEXT,"
      " payload_json TEXT NOT NULL DEFAULT '{}',"
      " priority INTEGER NOT NULL DEFAULT 0,"
      " attempts INTEGER NOT NULL DEFAULT 0,"
      " max_attempts INTEGER NOT NULL DEFAULT 3,"
      " run_at BIGINT NOT NULL,"
      " locked_at BIGINT,"
      " lock_expires_at BIGINT,"
      " locked_by TEXT,"
      " dedupe_key TEXT,"
      " dedupe_active TEXT,"
      " cancel_requested_at BIGINT,"
      " cancelled_at BIGINT,"
      " last_error TEXT,"
      " created_at BIGINT NOT NULL,"
      " updated_at BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS jobs_state_run_at_idx ON jobs(state, run_at);",
      "CREATE INDEX IF NOT EXISTS jobs_project_idx ON jobs(project_id);",
      "CREATE UNIQUE INDEX IF NOT EXISTS jobs_dedupe_active_idx ON jobs(dedupe_key, dedupe_active);",
      "CREATE TABLE IF NOT EXISTS queue_settings ("
      " id INTEGER PRIMARY KEY CHECK (id = 1),"
      " paused BOOLEAN NOT NULL DEFAULT FALSE,"
      " concurrency INTEGER NOT NULL DEFAULT 2 CHECK (concurrency BETWEEN 1 AND 20),"
      " updated_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ports ("
      " port INTEGER PRIMARY KEY,"
      " port_type TEXT NOT NULL CHECK (port_type IN ('base','version','dev')),"
      " project_id TEXT,"
      " hash TEXT,"
      " created_at BIGINT NOT NULL,"
      " updated_at BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ports_project_idx ON ports(project_id);",
      "CREATE TABLE IF NOT EXISTS projects ("
      " id TEXT PRIMARY KEY,"
      " name TEXT NOT NULL,"
      " path_on_disk TEXT NOT NULL,"
      " status TEXT NOT NULL,"
      " dev_port INTEGER,"
      " runtime_port INTEGER,"
      " production_status TEXT NOT NULL DEFAULT 'stopped',"
      " production_hash TEXT,"
      " production_port INTEGER,"
      " production_url TEXT,"
      " production_error TEXT,"
      " production_started_at BIGINT,"
      " created_at BIGINT NOT NULL,"
      " updated_at BIGINT NOT NULL);"};
  return kSchema;
}

} // namespace sandbox::db::sql
