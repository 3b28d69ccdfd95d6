#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/json.hpp"

namespace fleetq::db::sqlite {

using fleetq::db::ErrorCode;
using fleetq::db::Result;
using fleetq::model::ProxyStatus;
using fleetq::model::ResultStatus;
using fleetq::model::TaskStatus;
using fleetq::model::WorkerStatus;

namespace {

constexpr const char* kTaskColumns =
    "id,item_id,status,worker_id,attempts,max_attempts,created_at_ms,last_attempt_at_ms,completed_at_ms";

constexpr const char* kProxyColumns =
    "id,proxy,status,locked_by,locked_at_ms,uses_count,blocks_count,last_used_at_ms,created_at_ms";

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

bool ColNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

template <typename Enum>
Enum ParseOrThrow(std::optional<Enum> parsed, const std::string& text) {
  if (!parsed) throw std::runtime_error("sqlite row has unknown status '" + text + "'");
  return *parsed;
}

model::TaskRecord ReadTask(sqlite3_stmt* st) {
  model::TaskRecord r;
  r.id                 = ColI64(st, 0);
  r.item_id            = ColI64(st, 1);
  const auto status    = ColText(st, 2);
  r.status             = ParseOrThrow(fleetq::model::ParseTaskStatus(status), status);
  r.worker_id          = ColText(st, 3);
  r.attempts           = static_cast<uint32_t>(ColI64(st, 4));
  r.max_attempts       = static_cast<uint32_t>(ColI64(st, 5));
  r.created_at_ms      = ColI64(st, 6);
  r.last_attempt_at_ms = ColI64(st, 7);
  r.completed_at_ms    = ColI64(st, 8);
  return r;
}

model::ProxyRecord ReadProxy(sqlite3_stmt* st) {
  model::ProxyRecord r;
  r.id              = ColI64(st, 0);
  r.proxy           = ColText(st, 1);
  const auto status = ColText(st, 2);
  r.status          = ParseOrThrow(fleetq::model::ParseProxyStatus(status), status);
  r.locked_by       = ColText(st, 3);
  r.locked_at_ms    = ColI64(st, 4);
  r.uses_count      = static_cast<uint32_t>(ColI64(st, 5));
  r.blocks_count    = static_cast<uint32_t>(ColI64(st, 6));
  r.last_used_at_ms = ColI64(st, 7);
  r.created_at_ms   = ColI64(st, 8);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

namespace {

// Steps a statement expected to yield zero or one row, then drains it.
template <typename Reader>
auto StepOptional(sqlite3* db, Statement& st, Reader read, const char* what)
    -> std::optional<decltype(read(st.Get()))> {
  int rc = st.Step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    ThrowIfDbError(Result::Err(rc == SQLITE_BUSY ? ErrorCode::Busy : ErrorCode::InternalError, sqlite3_errmsg(db)), what);
  }
  auto row = read(st.Get());
  while ((rc = st.Step()) == SQLITE_ROW) {
  }
  if (rc != SQLITE_DONE) {
    ThrowIfDbError(Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db)), what);
  }
  return row;
}

uint64_t StepChanges(sqlite3* db, Statement& st, const char* what) {
  int rc = st.Step();
  if (rc != SQLITE_DONE) {
    ThrowIfDbError(Result::Err(rc == SQLITE_BUSY ? ErrorCode::Busy : ErrorCode::InternalError, sqlite3_errmsg(db)), what);
  }
  return static_cast<uint64_t>(sqlite3_changes(db));
}

} // namespace

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO tasks(item_id,status,worker_id,attempts,max_attempts,created_at_ms)"
                                        " VALUES(?,?,?,?,?,?) ON CONFLICT(item_id) DO NOTHING RETURNING ") + kTaskColumns + ";";
    Statement st(db, sql.c_str());
    st.BindInt64(1, r.item_id);
    st.BindText(2, std::string(fleetq::model::ToString(r.status)));
    st.BindText(3, r.worker_id);
    st.BindInt64(4, r.attempts);
    st.BindInt64(5, r.max_attempts);
    st.BindInt64(6, r.created_at_ms);

    int rc = st.Step();
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::AlreadyExists, "item " + std::to_string(r.item_id));
    if (rc != SQLITE_ROW) return Translate(db, rc);

    r = ReadTask(st.Get());
    while ((rc = st.Step()) == SQLITE_ROW) {
    }
    return Translate(db, rc);
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, int64_t task_id) {
    auto* db = TX(t).Handle();
    const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id=?;";
    Statement st(db, sql.c_str());
    st.BindInt64(1, task_id);
    return StepOptional(db, st, ReadTask, "get task");
}

std::optional<model::TaskRecord> SqliteRepository::FindTaskByItem(Transaction& t, int64_t item_id) {
    auto* db = TX(t).Handle();
    const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE item_id=?;";
    Statement st(db, sql.c_str());
    st.BindInt64(1, item_id);
    return StepOptional(db, st, ReadTask, "find task");
}

std::optional<model::TaskRecord> SqliteRepository::ClaimTask(Transaction& t, const std::string& worker_id, int64_t now_ms) {
    auto* db = TX(t).Handle();
    const std::string sql =
        std::string("UPDATE tasks SET status='processing', worker_id=?1, last_attempt_at_ms=?2"
                    " WHERE id=(SELECT id FROM tasks WHERE status='pending' ORDER BY created_at_ms, id LIMIT 1)"
                    " RETURNING ") + kTaskColumns + ";";
    Statement st(db, sql.c_str());
    st.BindText(1, worker_id);
    st.BindInt64(2, now_ms);
    return StepOptional(db, st, ReadTask, "claim task");
}

std::optional<model::TaskRecord> SqliteRepository::CompleteTask(Transaction& t, int64_t task_id,
                                                                const std::string& worker_id, int64_t now_ms) {
    auto* db = TX(t).Handle();
    const std::string sql =
        std::string("UPDATE tasks SET status='completed', completed_at_ms=?1, worker_id=NULL"
                    " WHERE id=?2 AND status='processing' AND worker_id=?3 RETURNING ") + kTaskColumns + ";";
    Statement st(db, sql.c_str());
    st.BindInt64(1, now_ms);
    st.BindInt64(2, task_id);
    st.BindText(3, worker_id);
    return StepOptional(db, st, ReadTask, "complete task");
}

std::optional<model::TaskRecord> SqliteRepository::FailTaskAttempt(Transaction& t, int64_t task_id,
                                                                   const std::string& worker_id) {
    auto* db = TX(t).Handle();
    const std::string sql =
        std::string("UPDATE tasks SET attempts=attempts+1,"
                    " status=CASE WHEN attempts+1>=max_attempts THEN 'failed' ELSE 'pending' END,"
                    " worker_id=NULL"
                    " WHERE id=?1 AND status='processing' AND worker_id=?2 RETURNING ") + kTaskColumns + ";";
    Statement st(db, sql.c_str());
    st.BindInt64(1, task_id);
    st.BindText(2, worker_id);
    return StepOptional(db, st, ReadTask, "fail task attempt");
}

std::optional<model::TaskRecord> SqliteRepository::ReturnTask(Transaction& t, int64_t task_id,
                                                              const std::string& worker_id) {
    auto* db = TX(t).Handle();
    const std::string sql =
        std::string("UPDATE tasks SET status='pending', worker_id=NULL"
                    " WHERE id=?1 AND status='processing' AND worker_id=?2 RETURNING ") + kTaskColumns + ";";
    Statement st(db, sql.c_str());
    st.BindInt64(1, task_id);
    st.BindText(2, worker_id);
    return StepOptional(db, st, ReadTask, "return task");
}

uint64_t SqliteRepository::ReclaimStaleTasks(Transaction& t, int64_t cutoff_ms) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "UPDATE tasks SET status='pending', worker_id=NULL"
                 " WHERE status='processing' AND last_attempt_at_ms < ?1;");
    st.BindInt64(1, cutoff_ms);
    return StepChanges(db, st, "reclaim stale tasks");
}

uint64_t SqliteRepository::FailExhaustedTasks(Transaction& t) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE tasks SET status='failed' WHERE status='pending' AND attempts >= max_attempts;");
    return StepChanges(db, st, "fail exhausted tasks");
}

uint64_t SqliteRepository::DeleteAllTasks(Transaction& t) {
    auto* db = TX(t).Handle();
    Statement st(db, "DELETE FROM tasks;");
    return StepChanges(db, st, "delete tasks");
}

// ------------------------------------------------------------------
// Proxies
// ------------------------------------------------------------------

Result SqliteRepository::InsertProxy(Transaction& t, model::ProxyRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO proxies(proxy,status,created_at_ms) VALUES(?,?,?)"
                                        " ON CONFLICT(proxy) DO NOTHING RETURNING ") + kProxyColumns + ";";
    Statement st(db, sql.c_str());
    st.BindText(1, r.proxy);
    st.BindText(2, std::string(fleetq::model::ToString(r.status)));
    st.BindInt64(3, r.created_at_ms);

    int rc = st.Step();
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::AlreadyExists, r.proxy);
    if (rc != SQLITE_ROW) return Translate(db, rc);

    r = ReadProxy(st.Get());
    while ((rc = st.Step()) == SQLITE_ROW) {
    }
    return Translate(db, rc);
}

std::optional<model::ProxyRecord> SqliteRepository::GetProxy(Transaction& t, int64_t proxy_id) {
    auto* db = TX(t).Handle();
    const std::string sql = std::string("SELECT ") + kProxyColumns + " FROM proxies WHERE id=?;";
    Statement st(db, sql.c_str());
    st.BindInt64(1, proxy_id);
    return StepOptional(db, st, ReadProxy, "get proxy");
}

std::optional<model::ProxyRecord> SqliteRepository::ClaimProxy(Transaction& t, const std::string& worker_id, int64_t now_ms) {
    auto* db = TX(t).Handle();
    const std::string sql =
        std::string("UPDATE proxies SET status='locked', locked_by=?1, locked_at_ms=?2,"
                    " uses_count=uses_count+1, last_used_at_ms=?2"
                    " WHERE id=(SELECT id FROM proxies WHERE status='available'"
                    " ORDER BY blocks_count, uses_count, id LIMIT 1)"
                    " RETURNING ") + kProxyColumns + ";";
    Statement st(db, sql.c_str());
    st.BindText(1, worker_id);
    st.BindInt64(2, now_ms);
    return StepOptional(db, st, ReadProxy, "claim proxy");
}

std::optional<model::ProxyRecord> SqliteRepository::ClaimProxyById(Transaction& t, int64_t proxy_id,
                                                                   const std::string& worker_id, int64_t now_ms) {
    auto* db = TX(t).Handle();
    const std::string sql =
        std::string("UPDATE proxies SET status='locked', locked_by=?1, locked_at_ms=?2,"
                    " uses_count=uses_count+1, last_used_at_ms=?2"
                    " WHERE id=?3 AND status='available' RETURNING ") + kProxyColumns + ";";
    Statement st(db, sql.c_str());
    st.BindText(1, worker_id);
    st.BindInt64(2, now_ms);
    st.BindInt64(3, proxy_id);
    return StepOptional(db, st, ReadProxy, "claim proxy by id");
}

std::optional<model::ProxyRecord> SqliteRepository::ReleaseProxy(Transaction& t, int64_t proxy_id,
                                                                 const std::string& worker_id, int64_t now_ms) {
    auto* db = TX(t).Handle();
    const std::string sql =
        std::string("UPDATE proxies SET status='available', locked_by=NULL, locked_at_ms=NULL, last_used_at_ms=?1"
                    " WHERE id=?2 AND status='locked' AND locked_by=?3 RETURNING ") + kProxyColumns + ";";
    Statement st(db, sql.c_str());
    st.BindInt64(1, now_ms);
    st.BindInt64(2, proxy_id);
    st.BindText(3, worker_id);
    return StepOptional(db, st, ReadProxy, "release proxy");
}

std::optional<model::ProxyRecord> SqliteRepository::BlockProxy(Transaction& t, int64_t proxy_id,
                                                               const std::string& worker_id, uint32_t threshold,
                                                               int64_t now_ms) {
    auto* db = TX(t).Handle();
    const std::string sql =
        std::string("UPDATE proxies SET blocks_count=blocks_count+1,"
                    " status=CASE WHEN blocks_count+1>=?1 THEN 'blocked' ELSE 'available' END,"
                    " locked_by=NULL, locked_at_ms=NULL, last_used_at_ms=?2"
                    " WHERE id=?3 AND (status='available' OR (status='locked' AND locked_by=?4))"
                    " RETURNING ") + kProxyColumns + ";";
    Statement st(db, sql.c_str());
    st.BindInt64(1, threshold);
    st.BindInt64(2, now_ms);
    st.BindInt64(3, proxy_id);
    st.BindText(4, worker_id);
    return StepOptional(db, st, ReadProxy, "block proxy");
}

uint64_t SqliteRepository::ReclaimStaleProxies(Transaction& t, int64_t cutoff_ms, int64_t now_ms) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "UPDATE proxies SET status='available', locked_by=NULL, locked_at_ms=NULL, last_used_at_ms=?1"
                 " WHERE status='locked' AND locked_at_ms < ?2;");
    st.BindInt64(1, now_ms);
    st.BindInt64(2, cutoff_ms);
    return StepChanges(db, st, "reclaim stale proxies");
}

uint64_t SqliteRepository::DeleteAllProxies(Transaction& t) {
    auto* db = TX(t).Handle();
    Statement st(db, "DELETE FROM proxies;");
    return StepChanges(db, st, "delete proxies");
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertWorker(Transaction& t, const std::string& worker_id, int64_t now_ms) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "INSERT INTO workers(worker_id,status,started_at_ms,last_heartbeat_ms) VALUES(?1,'active',?2,?2)"
                 " ON CONFLICT(worker_id) DO UPDATE SET status='active',"
                 " last_heartbeat_ms=MAX(workers.last_heartbeat_ms, excluded.last_heartbeat_ms);");
    st.BindText(1, worker_id);
    st.BindInt64(2, now_ms);
    return Translate(db, st.Step());
}

Result SqliteRepository::TouchWorker(Transaction& t, const std::string& worker_id, int64_t now_ms) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE workers SET status='active', last_heartbeat_ms=MAX(last_heartbeat_ms, ?1)"
                     " WHERE worker_id=?2;");
    st.BindInt64(1, now_ms);
    st.BindText(2, worker_id);
    int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, worker_id);
    return Result::Ok();
}

Result SqliteRepository::IncrementWorkerCounter(Transaction& t, const std::string& worker_id, bool success) {
    auto* db = TX(t).Handle();
    Statement st(db, success ? "UPDATE workers SET tasks_processed=tasks_processed+1 WHERE worker_id=?;"
                             : "UPDATE workers SET tasks_failed=tasks_failed+1 WHERE worker_id=?;");
    st.BindText(1, worker_id);
    int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, worker_id);
    return Result::Ok();
}

Result SqliteRepository::StopWorker(Transaction& t, const std::string& worker_id) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE workers SET status='stopped' WHERE worker_id=?;");
    st.BindText(1, worker_id);
    int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, worker_id);
    return Result::Ok();
}

std::optional<model::WorkerRecord> SqliteRepository::GetWorker(Transaction& t, const std::string& worker_id) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "SELECT worker_id,status,tasks_processed,tasks_failed,started_at_ms,last_heartbeat_ms"
                 " FROM workers WHERE worker_id=?;");
    st.BindText(1, worker_id);
    return StepOptional(
        db, st,
        [](sqlite3_stmt* row) {
          model::WorkerRecord w;
          w.worker_id         = ColText(row, 0);
          const auto status   = ColText(row, 1);
          w.status            = ParseOrThrow(fleetq::model::ParseWorkerStatus(status), status);
          w.tasks_processed   = static_cast<uint64_t>(ColI64(row, 2));
          w.tasks_failed      = static_cast<uint64_t>(ColI64(row, 3));
          w.started_at_ms     = ColI64(row, 4);
          w.last_heartbeat_ms = ColI64(row, 5);
          return w;
        },
        "get worker");
}

uint64_t SqliteRepository::StopDeadWorkers(Transaction& t, int64_t cutoff_ms) {
    auto* db = TX(t).Handle();
    Statement st(db, "UPDATE workers SET status='stopped' WHERE status='active' AND last_heartbeat_ms < ?;");
    st.BindInt64(1, cutoff_ms);
    return StepChanges(db, st, "stop dead workers");
}

// ------------------------------------------------------------------
// Results
// ------------------------------------------------------------------

Result SqliteRepository::UpsertResult(Transaction& t, const model::ResultRecord& r, int64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "INSERT INTO results(item_id,title,description,characteristics,price,published_at,"
                 "seller_name,seller_profile_url,location_address,location_metro,location_region,views_total,"
                 "status,failure_reason,worker_id,attempts,processed_at_ms,created_at_ms,updated_at_ms)"
                 " VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12,?13,?14,?15,?16,?17,?18,?18)"
                 " ON CONFLICT(item_id) DO UPDATE SET"
                 " title=excluded.title,"
                 " description=excluded.description,"
                 " characteristics=excluded.characteristics,"
                 " price=excluded.price,"
                 " published_at=excluded.published_at,"
                 " seller_name=excluded.seller_name,"
                 " seller_profile_url=excluded.seller_profile_url,"
                 " location_address=excluded.location_address,"
                 " location_metro=excluded.location_metro,"
                 " location_region=excluded.location_region,"
                 " views_total=excluded.views_total,"
                 " status=excluded.status,"
                 " failure_reason=excluded.failure_reason,"
                 " worker_id=excluded.worker_id,"
                 " attempts=excluded.attempts,"
                 " processed_at_ms=excluded.processed_at_ms,"
                 " updated_at_ms=excluded.updated_at_ms;");

    st.BindInt64(1, r.item_id);
    st.BindText(2, r.title);
    st.BindText(3, r.description);
    if (r.characteristics.empty()) {
        st.BindNull(4);
    } else {
        st.BindText(4, util::EncodeStringMap(r.characteristics));
    }
    if (r.price) {
        st.BindDouble(5, *r.price);
    } else {
        st.BindNull(5);
    }
    st.BindText(6, r.published_at);
    st.BindText(7, r.seller_name);
    st.BindText(8, r.seller_profile_url);
    st.BindText(9, r.location_address);
    st.BindText(10, r.location_metro);
    st.BindText(11, r.location_region);
    if (r.views_total) {
        st.BindInt64(12, *r.views_total);
    } else {
        st.BindNull(12);
    }
    st.BindText(13, std::string(fleetq::model::ToString(r.status)));
    st.BindText(14, r.failure_reason);
    st.BindText(15, r.worker_id);
    st.BindInt64(16, r.attempts);
    st.BindInt64(17, r.processed_at_ms);
    st.BindInt64(18, now_ms);

    return Translate(db, st.Step());
}

std::optional<model::ResultRecord> SqliteRepository::GetResult(Transaction& t, int64_t item_id) {
    auto* db = TX(t).Handle();
    Statement st(db,
                 "SELECT item_id,title,description,characteristics,price,published_at,"
                 "seller_name,seller_profile_url,location_address,location_metro,location_region,views_total,"
                 "status,failure_reason,worker_id,attempts,processed_at_ms,created_at_ms,updated_at_ms"
                 " FROM results WHERE item_id=?;");
    st.BindInt64(1, item_id);
    return StepOptional(
        db, st,
        [](sqlite3_stmt* row) {
          model::ResultRecord r;
          r.item_id         = ColI64(row, 0);
          r.title           = ColText(row, 1);
          r.description     = ColText(row, 2);
          r.characteristics = util::DecodeStringMap(ColText(row, 3));
          if (!ColNull(row, 4)) r.price = sqlite3_column_double(row, 4);
          r.published_at       = ColText(row, 5);
          r.seller_name        = ColText(row, 6);
          r.seller_profile_url = ColText(row, 7);
          r.location_address   = ColText(row, 8);
          r.location_metro     = ColText(row, 9);
          r.location_region    = ColText(row, 10);
          if (!ColNull(row, 11)) r.views_total = ColI64(row, 11);
          const auto status = ColText(row, 12);
          r.status          = ParseOrThrow(fleetq::model::ParseResultStatus(status), status);
          r.failure_reason  = ColText(row, 13);
          r.worker_id       = ColText(row, 14);
          r.attempts        = static_cast<uint32_t>(ColI64(row, 15));
          r.processed_at_ms = ColI64(row, 16);
          r.created_at_ms   = ColI64(row, 17);
          r.updated_at_ms   = ColI64(row, 18);
          return r;
        },
        "get result");
}

// ------------------------------------------------------------------
// Status
// ------------------------------------------------------------------

model::StatusCounts SqliteRepository::CollectStatus(Transaction& t, const model::HealthCutoffs& cutoffs) {
    auto* db = TX(t).Handle();
    model::StatusCounts c;

    {
        Statement st(db, "SELECT status, COUNT(*) FROM tasks GROUP BY status;");
        int rc;
        while ((rc = st.Step()) == SQLITE_ROW) {
            const auto status = ColText(st.Get(), 0);
            const auto n      = static_cast<uint64_t>(ColI64(st.Get(), 1));
            switch (ParseOrThrow(fleetq::model::ParseTaskStatus(status), status)) {
                case TaskStatus::kPending: c.tasks_pending = n; break;
                case TaskStatus::kProcessing: c.tasks_processing = n; break;
                case TaskStatus::kCompleted: c.tasks_completed = n; break;
                case TaskStatus::kFailed: c.tasks_failed = n; break;
            }
        }
        ThrowIfDbError(Translate(db, rc), "count tasks");
    }

    {
        Statement st(db, "SELECT status, COUNT(*) FROM proxies GROUP BY status;");
        int rc;
        while ((rc = st.Step()) == SQLITE_ROW) {
            const auto status = ColText(st.Get(), 0);
            const auto n      = static_cast<uint64_t>(ColI64(st.Get(), 1));
            switch (ParseOrThrow(fleetq::model::ParseProxyStatus(status), status)) {
                case ProxyStatus::kAvailable: c.proxies_available = n; break;
                case ProxyStatus::kLocked: c.proxies_locked = n; break;
                case ProxyStatus::kBlocked: c.proxies_blocked = n; break;
            }
        }
        ThrowIfDbError(Translate(db, rc), "count proxies");
    }

    {
        Statement st(db, "SELECT status, COUNT(*) FROM workers GROUP BY status;");
        int rc;
        while ((rc = st.Step()) == SQLITE_ROW) {
            const auto status = ColText(st.Get(), 0);
            const auto n      = static_cast<uint64_t>(ColI64(st.Get(), 1));
            if (ParseOrThrow(fleetq::model::ParseWorkerStatus(status), status) == WorkerStatus::kActive) {
                c.workers_active = n;
            } else {
                c.workers_stopped = n;
            }
        }
        ThrowIfDbError(Translate(db, rc), "count workers");
    }

    {
        Statement st(db,
                     "SELECT"
                     " (SELECT COUNT(*) FROM tasks WHERE status='processing' AND last_attempt_at_ms < ?1),"
                     " (SELECT COUNT(*) FROM proxies WHERE status='locked' AND locked_at_ms < ?2),"
                     " (SELECT COUNT(*) FROM workers WHERE status='active' AND last_heartbeat_ms < ?3),"
                     " (SELECT COUNT(*) FROM results);");
        st.BindInt64(1, cutoffs.stale_task_before_ms);
        st.BindInt64(2, cutoffs.stale_lock_before_ms);
        st.BindInt64(3, cutoffs.dead_worker_before_ms);
        int rc = st.Step();
        if (rc != SQLITE_ROW) ThrowIfDbError(Translate(db, rc), "health counters");
        c.stuck_tasks   = static_cast<uint64_t>(ColI64(st.Get(), 0));
        c.stuck_proxies = static_cast<uint64_t>(ColI64(st.Get(), 1));
        c.dead_workers  = static_cast<uint64_t>(ColI64(st.Get(), 2));
        c.results       = static_cast<uint64_t>(ColI64(st.Get(), 3));
    }

    return c;
}

} // namespace fleetq::db::sqlite
