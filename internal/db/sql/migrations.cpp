#include "migrations.hpp"

namespace fleetq::db::sql {

namespace {

// BIGINT has INTEGER affinity on sqlite, so one statement fits both engines
constexpr const char* kVersionTable =
    "CREATE TABLE IF NOT EXISTS fleetq_schema_migrations ("
    " version INTEGER PRIMARY KEY,"
    " applied_at_ms BIGINT NOT NULL);";

} // namespace

bool RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql, int version,
                   int64_t applied_at_ms) {
  executor.ExecuteSQL(kVersionTable);
  if (executor.VersionApplied(version)) return false;

  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }

  executor.ExecuteSQL("INSERT INTO fleetq_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(version) +
                      ", " + std::to_string(applied_at_ms) + ") ON CONFLICT(version) DO NOTHING;");
  return true;
}

} // namespace fleetq::db::sql
