#include "factory.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/processing/exec_session.hpp"
#if FLEETQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLEETQ_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace fleetq::factory {

using fleetq::runtime::config::RuntimeConfig;

namespace {

#if FLEETQ_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  bool VersionApplied(int version) override {
    db::sqlite::Statement st(db_.Handle(), "SELECT 1 FROM fleetq_schema_migrations WHERE version=?1;");
    st.BindInt64(1, version);
    return st.Step() == SQLITE_ROW;
  }

 private:
  db::sqlite::SqliteDB& db_;
};

void BootstrapSqliteSchema(db::sqlite::SqliteDB& sqlite_db) {
  std::lock_guard lock(sqlite_db.WriterMutex());

  sqlite_db.Exec("BEGIN IMMEDIATE;");
  try {
    SqliteMigrationExecutor executor(sqlite_db);
    const bool applied = db::sql::RunMigrations(executor, db::sql::SqliteSchema(), db::sql::kSchemaVersion,
                                                util::ToUnixMillis(util::Now()));
    sqlite_db.Exec("COMMIT;");
    if (applied) FLEETQ_LOG_INFO("schema migrated", {observability::IntField("version", db::sql::kSchemaVersion)});
  } catch (const std::exception&) {
    sqlite_db.Exec("ROLLBACK;");
    throw;
  }
}
#endif

#if FLEETQ_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  bool VersionApplied(int version) override {
    return !tx_.exec_params("SELECT 1 FROM fleetq_schema_migrations WHERE version=$1", version).empty();
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(db::postgres::PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  PostgresMigrationExecutor executor(tx);
  const bool applied = db::sql::RunMigrations(executor, db::sql::PostgresSchema(), db::sql::kSchemaVersion,
                                              util::ToUnixMillis(util::Now()));
  tx.commit();
  if (applied) FLEETQ_LOG_INFO("schema migrated", {observability::IntField("version", db::sql::kSchemaVersion)});
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLEETQ_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(*sqlite_db);
    FLEETQ_LOG_INFO("database ready", {observability::StringField("backend", "sqlite"),
                                       observability::StringField("path", database.sqlite().path()),
                                       observability::IntField("schema_version", db::sql::kSchemaVersion)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLEETQ_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       database.postgres().max_connections());
    BootstrapPostgresSchema(*pool);
    FLEETQ_LOG_INFO("database ready", {observability::StringField("backend", "postgres"),
                                       observability::IntField("schema_version", db::sql::kSchemaVersion)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FLEETQ_LOG_WARN("no database configured, using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const RuntimeConfig& config, util::NowFn now) {
  Application app;

  const uint32_t retries = config.queue().claim_conflict_retries();

  app.repository = BuildRepository(config);
  app.tasks      = std::make_shared<queue::TaskQueue>(app.repository, now, retries);
  app.proxies    = std::make_shared<proxy::ProxyPool>(app.repository, now, config.proxies().block_threshold(), retries);
  app.registry   = std::make_shared<worker::WorkerRegistry>(app.repository, now, retries);
  app.results    = std::make_shared<results::ResultStore>(app.repository, now, retries);

  const auto reaper = ReaperOptionsFrom(config);
  app.status        = std::make_shared<service::StatusService>(
      app.repository, now,
      service::HealthThresholds{reaper.stale_task_after, reaper.stale_lock_after, reaper.dead_worker_after});

  return app;
}

reaper::ReaperOptions ReaperOptionsFrom(const RuntimeConfig& config) {
  const auto& r = config.reaper();

  reaper::ReaperOptions options;
  options.interval          = util::FromProto(r.interval());
  options.stale_task_after  = util::FromProto(r.stale_task_after());
  options.stale_lock_after  = util::FromProto(r.stale_lock_after());
  options.dead_worker_after = util::FromProto(r.dead_worker_after());
  options.conflict_retries  = config.queue().claim_conflict_retries();
  return options;
}

runtime::FleetOptions FleetOptionsFrom(const RuntimeConfig& config) {
  const auto& w = config.worker();

  runtime::FleetOptions options;
  options.program_id                = w.program_id();
  options.lanes                     = w.lanes();
  options.heartbeat_interval        = util::FromProto(w.heartbeat_interval());
  options.lane.no_proxy_backoff     = util::FromProto(w.no_proxy_backoff());
  options.lane.store_retry_attempts = w.store_retry_attempts();
  options.lane.store_retry_delay    = util::FromProto(w.store_retry_delay());
  if (config.reaper().embedded()) options.embedded_reaper = ReaperOptionsFrom(config);
  return options;
}

std::shared_ptr<processing::SessionFactory> BuildSessionFactory(const RuntimeConfig& config) {
  const auto& p = config.processor();

  std::vector<std::string> command(p.command().begin(), p.command().end());
  if (command.empty()) throw std::runtime_error("processor.command is required to run workers");
  return std::make_shared<processing::ExecSessionFactory>(std::move(command), util::FromProto(p.timeout()));
}

worker::LaneServices LaneServicesFor(const Application& app, std::shared_ptr<processing::SessionFactory> sessions,
                                     util::NowFn now) {
  worker::LaneServices services;
  services.tasks    = app.tasks;
  services.proxies  = app.proxies;
  services.registry = app.registry;
  services.results  = app.results;
  services.sessions = std::move(sessions);
  services.now      = std::move(now);
  return services;
}

} // namespace fleetq::factory
