#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fleetq::db::sql {

// Runs statements inside a transaction the caller owns.
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual bool VersionApplied(int version) = 0;
};

/*
  Brings the schema to `version`.

  fleetq_schema_migrations is created first; when it already records
  `version` nothing else runs. Otherwise every statement of ordered_sql is
  executed and the version recorded. Returns whether anything was applied.
*/
bool RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql, int version,
                   int64_t applied_at_ms);

} // namespace fleetq::db::sql
