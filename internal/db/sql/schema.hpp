#pragma once

#include <string>
#include <vector>

namespace fleetq::db::sql {

/*
  Schema DDL per backend.

  Timestamps are epoch milliseconds in *_ms BIGINT columns on both engines so
  rows compare the same way everywhere. Every statement is idempotent.
  The version table is owned by RunMigrations.

  Indexes mirror the claim / sweep access paths:
    tasks(status, created_at_ms)        pending claim, FIFO
    tasks(status, last_attempt_at_ms)   stale processing sweep
    proxies(status, blocks_count, uses_count)  available claim, fewest blocks
    proxies(status, locked_at_ms)       stale lock sweep
    workers(last_heartbeat_ms)          dead worker sweep
    results(status, processed_at_ms)    export
*/

inline constexpr int kSchemaVersion = 1;

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS tasks ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " item_id INTEGER NOT NULL UNIQUE,"
      " status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending','processing','completed','failed')),"
      " worker_id TEXT,"
      " attempts INTEGER NOT NULL DEFAULT 0,"
      " max_attempts INTEGER NOT NULL DEFAULT 5,"
      " created_at_ms INTEGER NOT NULL,"
      " last_attempt_at_ms INTEGER,"
      " completed_at_ms INTEGER);",

      "CREATE TABLE IF NOT EXISTS proxies ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " proxy TEXT NOT NULL UNIQUE,"
      " status TEXT NOT NULL DEFAULT 'available' CHECK (status IN ('available','locked','blocked')),"
      " locked_by TEXT,"
      " locked_at_ms INTEGER,"
      " uses_count INTEGER NOT NULL DEFAULT 0,"
      " blocks_count INTEGER NOT NULL DEFAULT 0,"
      " last_used_at_ms INTEGER,"
      " created_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS workers ("
      " worker_id TEXT PRIMARY KEY,"
      " status TEXT NOT NULL DEFAULT 'active' CHECK (status IN ('active','stopped')),"
      " tasks_processed INTEGER NOT NULL DEFAULT 0,"
      " tasks_failed INTEGER NOT NULL DEFAULT 0,"
      " started_at_ms INTEGER NOT NULL,"
      " last_heartbeat_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS results ("
      " item_id INTEGER PRIMARY KEY,"
      " title TEXT,"
      " description TEXT,"
      " characteristics TEXT,"
      " price REAL,"
      " published_at TEXT,"
      " seller_name TEXT,"
      " seller_profile_url TEXT,"
      " location_address TEXT,"
      " location_metro TEXT,"
      " location_region TEXT,"
      " views_total INTEGER,"
      " status TEXT NOT NULL CHECK (status IN ('success','unavailable')),"
      " failure_reason TEXT,"
      " worker_id TEXT,"
      " attempts INTEGER NOT NULL DEFAULT 1,"
      " processed_at_ms INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_tasks_pending ON tasks(status, created_at_ms) WHERE status = 'pending';",
      "CREATE INDEX IF NOT EXISTS idx_tasks_processing ON tasks(status, last_attempt_at_ms) WHERE status = 'processing';",
      "CREATE INDEX IF NOT EXISTS idx_proxies_available ON proxies(status, blocks_count, uses_count) WHERE status = 'available';",
      "CREATE INDEX IF NOT EXISTS idx_proxies_locked ON proxies(status, locked_at_ms) WHERE status = 'locked';",
      "CREATE INDEX IF NOT EXISTS idx_workers_heartbeat ON workers(last_heartbeat_ms);",
      "CREATE INDEX IF NOT EXISTS idx_results_status_processed ON results(status, processed_at_ms);"};
  return kSql;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS tasks ("
      " id BIGSERIAL PRIMARY KEY,"
      " item_id BIGINT NOT NULL UNIQUE,"
      " status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending','processing','completed','failed')),"
      " worker_id TEXT,"
      " attempts INTEGER NOT NULL DEFAULT 0,"
      " max_attempts INTEGER NOT NULL DEFAULT 5,"
      " created_at_ms BIGINT NOT NULL,"
      " last_attempt_at_ms BIGINT,"
      " completed_at_ms BIGINT);",

      "CREATE TABLE IF NOT EXISTS proxies ("
      " id BIGSERIAL PRIMARY KEY,"
      " proxy TEXT NOT NULL UNIQUE,"
      " status TEXT NOT NULL DEFAULT 'available' CHECK (status IN ('available','locked','blocked')),"
      " locked_by TEXT,"
      " locked_at_ms BIGINT,"
      " uses_count INTEGER NOT NULL DEFAULT 0,"
      " blocks_count INTEGER NOT NULL DEFAULT 0,"
      " last_used_at_ms BIGINT,"
      " created_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS workers ("
      " worker_id TEXT PRIMARY KEY,"
      " status TEXT NOT NULL DEFAULT 'active' CHECK (status IN ('active','stopped')),"
      " tasks_processed BIGINT NOT NULL DEFAULT 0,"
      " tasks_failed BIGINT NOT NULL DEFAULT 0,"
      " started_at_ms BIGINT NOT NULL,"
      " last_heartbeat_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS results ("
      " item_id BIGINT PRIMARY KEY,"
      " title TEXT,"
      " description TEXT,"
      " characteristics JSONB,"
      " price NUMERIC(12, 2),"
      " published_at TEXT,"
      " seller_name TEXT,"
      " seller_profile_url TEXT,"
      " location_address TEXT,"
      " location_metro TEXT,"
      " location_region TEXT,"
      " views_total BIGINT,"
      " status TEXT NOT NULL CHECK (status IN ('success','unavailable')),"
      " failure_reason TEXT,"
      " worker_id TEXT,"
      " attempts INTEGER NOT NULL DEFAULT 1,"
      " processed_at_ms BIGINT NOT NULL,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_tasks_pending ON tasks(status, created_at_ms) WHERE status = 'pending';",
      "CREATE INDEX IF NOT EXISTS idx_tasks_processing ON tasks(status, last_attempt_at_ms) WHERE status = 'processing';",
      "CREATE INDEX IF NOT EXISTS idx_proxies_available ON proxies(status, blocks_count, uses_count) WHERE status = 'available';",
      "CREATE INDEX IF NOT EXISTS idx_proxies_locked ON proxies(status, locked_at_ms) WHERE status = 'locked';",
      "CREATE INDEX IF NOT EXISTS idx_workers_heartbeat ON workers(last_heartbeat_ms);",
      "CREATE INDEX IF NOT EXISTS idx_results_status_processed ON results(status, processed_at_ms);"};
  return kSql;
}

} // namespace fleetq::db::sql
