#include "pg_repository.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fleetq::db::postgres {

using fleetq::model::ProxyStatus;
using fleetq::model::TaskStatus;
using fleetq::model::WorkerStatus;

namespace {

constexpr const char* kTaskColumns =
    "id,item_id,status,worker_id,attempts,max_attempts,created_at_ms,last_attempt_at_ms,completed_at_ms";

constexpr const char* kProxyColumns =
    "id,proxy,status,locked_by,locked_at_ms,uses_count,blocks_count,last_used_at_ms,created_at_ms";

constexpr const char* kResultColumns =
    "item_id,title,description,characteristics::text,price::float8,published_at,"
    "seller_name,seller_profile_url,location_address,location_metro,location_region,views_total,"
    "status,failure_reason,worker_id,attempts,processed_at_ms,created_at_ms,updated_at_ms";

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

int64_t Millis(const pqxx::field& f) {
  return f.is_null() ? 0 : f.as<int64_t>();
}

template <typename Enum>
Enum ParseOrThrow(std::optional<Enum> parsed, const std::string& text) {
  if (!parsed) throw std::runtime_error("postgres row has unknown status '" + text + "'");
  return *parsed;
}

model::TaskRecord ReadTask(const pqxx::row& row) {
  model::TaskRecord r;
  r.id                 = row[0].as<int64_t>();
  r.item_id            = row[1].as<int64_t>();
  const auto status    = Text(row[2]);
  r.status             = ParseOrThrow(fleetq::model::ParseTaskStatus(status), status);
  r.worker_id          = Text(row[3]);
  r.attempts           = row[4].as<uint32_t>();
  r.max_attempts       = row[5].as<uint32_t>();
  r.created_at_ms      = Millis(row[6]);
  r.last_attempt_at_ms = Millis(row[7]);
  r.completed_at_ms    = Millis(row[8]);
  return r;
}

model::ProxyRecord ReadProxy(const pqxx::row& row) {
  model::ProxyRecord r;
  r.id              = row[0].as<int64_t>();
  r.proxy           = Text(row[1]);
  const auto status = Text(row[2]);
  r.status          = ParseOrThrow(fleetq::model::ParseProxyStatus(status), status);
  r.locked_by       = Text(row[3]);
  r.locked_at_ms    = Millis(row[4]);
  r.uses_count      = row[5].as<uint32_t>();
  r.blocks_count    = row[6].as<uint32_t>();
  r.last_used_at_ms = Millis(row[7]);
  r.created_at_ms   = Millis(row[8]);
  return r;
}

model::ResultRecord ReadResult(const pqxx::row& row) {
  model::ResultRecord r;
  r.item_id         = row[0].as<int64_t>();
  r.title           = Text(row[1]);
  r.description     = Text(row[2]);
  r.characteristics = util::DecodeStringMap(Text(row[3]));
  if (!row[4].is_null()) r.price = row[4].as<double>();
  r.published_at       = Text(row[5]);
  r.seller_name        = Text(row[6]);
  r.seller_profile_url = Text(row[7]);
  r.location_address   = Text(row[8]);
  r.location_metro     = Text(row[9]);
  r.location_region    = Text(row[10]);
  if (!row[11].is_null()) r.views_total = row[11].as<int64_t>();
  const auto status = Text(row[12]);
  r.status          = ParseOrThrow(fleetq::model::ParseResultStatus(status), status);
  r.failure_reason  = Text(row[13]);
  r.worker_id       = Text(row[14]);
  r.attempts        = row[15].as<uint32_t>();
  r.processed_at_ms = Millis(row[16]);
  r.created_at_ms   = Millis(row[17]);
  r.updated_at_ms   = Millis(row[18]);
  return r;
}

template <typename Reader>
auto FirstRow(const pqxx::result& res, Reader read) -> std::optional<decltype(read(res[0]))> {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

// Runs a query body, translating driver errors into util/errors.hpp types.
template <typename Body>
auto Guarded(const char* what, Body&& body) -> decltype(body()) {
  try {
    return body();
  } catch (const pqxx::transaction_rollback& e) {
    throw util::TransactionConflict(std::string(what) + ": " + e.what());
  } catch (const pqxx::unique_violation& e) {
    throw util::AlreadyExists(std::string(what) + ": " + e.what());
  } catch (const pqxx::sql_error& e) {
    throw std::runtime_error(std::string(what) + ": " + e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return Guarded("begin", [&]() -> std::unique_ptr<db::Transaction> { return std::make_unique<PgTransaction>(pool_); });
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ---------------------------------------------------------------------------
// Tasks
// ---------------------------------------------------------------------------

Result PgRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        std::string("INSERT INTO tasks(item_id,status,worker_id,attempts,max_attempts,created_at_ms) "
                    "VALUES($1,$2,$3,$4,$5,$6) ON CONFLICT(item_id) DO NOTHING RETURNING ") + kTaskColumns,
        r.item_id, std::string(fleetq::model::ToString(r.status)), NullIfEmpty(r.worker_id), r.attempts,
        r.max_attempts, r.created_at_ms);
    if (res.empty()) return Result::Err(ErrorCode::AlreadyExists, "item " + std::to_string(r.item_id));
    r = ReadTask(res[0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, int64_t task_id) {
  return Guarded("get task", [&] {
    return FirstRow(TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id=$1",
                                             task_id),
                    ReadTask);
  });
}

std::optional<model::TaskRecord> PgRepository::FindTaskByItem(Transaction& t, int64_t item_id) {
  return Guarded("find task", [&] {
    return FirstRow(
        TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE item_id=$1", item_id),
        ReadTask);
  });
}

std::optional<model::TaskRecord> PgRepository::ClaimTask(Transaction& t, const std::string& worker_id, int64_t now_ms) {
  return Guarded("claim task", [&] {
    return FirstRow(TX(t).Work().exec_prepared("claim_task", worker_id, now_ms), ReadTask);
  });
}

std::optional<model::TaskRecord> PgRepository::CompleteTask(Transaction& t, int64_t task_id,
                                                            const std::string& worker_id, int64_t now_ms) {
  return Guarded("complete task", [&] {
    return FirstRow(TX(t).Work().exec_prepared("complete_task", task_id, worker_id, now_ms), ReadTask);
  });
}

std::optional<model::TaskRecord> PgRepository::FailTaskAttempt(Transaction& t, int64_t task_id,
                                                               const std::string& worker_id) {
  return Guarded("fail task attempt", [&] {
    return FirstRow(TX(t).Work().exec_prepared("fail_task_attempt", task_id, worker_id), ReadTask);
  });
}

std::optional<model::TaskRecord> PgRepository::ReturnTask(Transaction& t, int64_t task_id,
                                                          const std::string& worker_id) {
  return Guarded("return task", [&] {
    return FirstRow(TX(t).Work().exec_prepared("return_task", task_id, worker_id), ReadTask);
  });
}

uint64_t PgRepository::ReclaimStaleTasks(Transaction& t, int64_t cutoff_ms) {
  return Guarded("reclaim stale tasks", [&] {
    auto res = TX(t).Work().exec_params(
        "UPDATE tasks SET status='pending', worker_id=NULL "
        "WHERE status='processing' AND last_attempt_at_ms < $1",
        cutoff_ms);
    return static_cast<uint64_t>(res.affected_rows());
  });
}

uint64_t PgRepository::FailExhaustedTasks(Transaction& t) {
  return Guarded("fail exhausted tasks", [&] {
    auto res = TX(t).Work().exec("UPDATE tasks SET status='failed' WHERE status='pending' AND attempts >= max_attempts");
    return static_cast<uint64_t>(res.affected_rows());
  });
}

uint64_t PgRepository::DeleteAllTasks(Transaction& t) {
  return Guarded("delete tasks", [&] {
    auto res = TX(t).Work().exec("DELETE FROM tasks");
    return static_cast<uint64_t>(res.affected_rows());
  });
}

// ---------------------------------------------------------------------------
// Proxies
// ---------------------------------------------------------------------------

Result PgRepository::InsertProxy(Transaction& t, model::ProxyRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        std::string("INSERT INTO proxies(proxy,status,created_at_ms) VALUES($1,$2,$3) "
                    "ON CONFLICT(proxy) DO NOTHING RETURNING ") + kProxyColumns,
        r.proxy, std::string(fleetq::model::ToString(r.status)), r.created_at_ms);
    if (res.empty()) return Result::Err(ErrorCode::AlreadyExists, r.proxy);
    r = ReadProxy(res[0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProxyRecord> PgRepository::GetProxy(Transaction& t, int64_t proxy_id) {
  return Guarded("get proxy", [&] {
    return FirstRow(
        TX(t).Work().exec_params(std::string("SELECT ") + kProxyColumns + " FROM proxies WHERE id=$1", proxy_id),
        ReadProxy);
  });
}

std::optional<model::ProxyRecord> PgRepository::ClaimProxy(Transaction& t, const std::string& worker_id, int64_t now_ms) {
  return Guarded("claim proxy", [&] {
    return FirstRow(TX(t).Work().exec_prepared("claim_proxy", worker_id, now_ms), ReadProxy);
  });
}

std::optional<model::ProxyRecord> PgRepository::ClaimProxyById(Transaction& t, int64_t proxy_id,
                                                               const std::string& worker_id, int64_t now_ms) {
  return Guarded("claim proxy by id", [&] {
    return FirstRow(TX(t).Work().exec_prepared("claim_proxy_by_id", proxy_id, worker_id, now_ms), ReadProxy);
  });
}

std::optional<model::ProxyRecord> PgRepository::ReleaseProxy(Transaction& t, int64_t proxy_id,
                                                             const std::string& worker_id, int64_t now_ms) {
  return Guarded("release proxy", [&] {
    return FirstRow(TX(t).Work().exec_prepared("release_proxy", proxy_id, worker_id, now_ms), ReadProxy);
  });
}

std::optional<model::ProxyRecord> PgRepository::BlockProxy(Transaction& t, int64_t proxy_id,
                                                           const std::string& worker_id, uint32_t threshold,
                                                           int64_t now_ms) {
  return Guarded("block proxy", [&] {
    return FirstRow(TX(t).Work().exec_prepared("block_proxy", proxy_id, worker_id, threshold, now_ms), ReadProxy);
  });
}

uint64_t PgRepository::ReclaimStaleProxies(Transaction& t, int64_t cutoff_ms, int64_t now_ms) {
  return Guarded("reclaim stale proxies", [&] {
    auto res = TX(t).Work().exec_params(
        "UPDATE proxies SET status='available', locked_by=NULL, locked_at_ms=NULL, last_used_at_ms=$1 "
        "WHERE status='locked' AND locked_at_ms < $2",
        now_ms, cutoff_ms);
    return static_cast<uint64_t>(res.affected_rows());
  });
}

uint64_t PgRepository::DeleteAllProxies(Transaction& t) {
  return Guarded("delete proxies", [&] {
    auto res = TX(t).Work().exec("DELETE FROM proxies");
    return static_cast<uint64_t>(res.affected_rows());
  });
}

// ---------------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------------

Result PgRepository::UpsertWorker(Transaction& t, const std::string& worker_id, int64_t now_ms) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO workers(worker_id,status,started_at_ms,last_heartbeat_ms) VALUES($1,'active',$2,$2) "
        "ON CONFLICT(worker_id) DO UPDATE SET status='active', "
        "last_heartbeat_ms=GREATEST(workers.last_heartbeat_ms, EXCLUDED.last_heartbeat_ms)",
        worker_id, now_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TouchWorker(Transaction& t, const std::string& worker_id, int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("touch_worker", worker_id, now_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, worker_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::IncrementWorkerCounter(Transaction& t, const std::string& worker_id, bool success) {
  try {
    auto res = TX(t).Work().exec_params(success ? "UPDATE workers SET tasks_processed=tasks_processed+1 WHERE worker_id=$1"
                                                : "UPDATE workers SET tasks_failed=tasks_failed+1 WHERE worker_id=$1",
                                        worker_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, worker_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::StopWorker(Transaction& t, const std::string& worker_id) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE workers SET status='stopped' WHERE worker_id=$1", worker_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, worker_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkerRecord> PgRepository::GetWorker(Transaction& t, const std::string& worker_id) {
  return Guarded("get worker", [&] {
    auto res = TX(t).Work().exec_params(
        "SELECT worker_id,status,tasks_processed,tasks_failed,started_at_ms,last_heartbeat_ms "
        "FROM workers WHERE worker_id=$1",
        worker_id);
    return FirstRow(res, [](const pqxx::row& row) {
      model::WorkerRecord w;
      w.worker_id         = Text(row[0]);
      const auto status   = Text(row[1]);
      w.status            = ParseOrThrow(fleetq::model::ParseWorkerStatus(status), status);
      w.tasks_processed   = row[2].as<uint64_t>();
      w.tasks_failed      = row[3].as<uint64_t>();
      w.started_at_ms     = Millis(row[4]);
      w.last_heartbeat_ms = Millis(row[5]);
      return w;
    });
  });
}

uint64_t PgRepository::StopDeadWorkers(Transaction& t, int64_t cutoff_ms) {
  return Guarded("stop dead workers", [&] {
    auto res = TX(t).Work().exec_params(
        "UPDATE workers SET status='stopped' WHERE status='active' AND last_heartbeat_ms < $1", cutoff_ms);
    return static_cast<uint64_t>(res.affected_rows());
  });
}

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

Result PgRepository::UpsertResult(Transaction& t, const model::ResultRecord& r, int64_t now_ms) {
  try {
    std::optional<std::string> characteristics;
    if (!r.characteristics.empty()) characteristics = util::EncodeStringMap(r.characteristics);

    TX(t).Work().exec_params(
        "INSERT INTO results(item_id,title,description,characteristics,price,published_at,"
        "seller_name,seller_profile_url,location_address,location_metro,location_region,views_total,"
        "status,failure_reason,worker_id,attempts,processed_at_ms,created_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4::jsonb,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$18) "
        "ON CONFLICT(item_id) DO UPDATE SET "
        "title=EXCLUDED.title,"
        "description=EXCLUDED.description,"
        "characteristics=EXCLUDED.characteristics,"
        "price=EXCLUDED.price,"
        "published_at=EXCLUDED.published_at,"
        "seller_name=EXCLUDED.seller_name,"
        "seller_profile_url=EXCLUDED.seller_profile_url,"
        "location_address=EXCLUDED.location_address,"
        "location_metro=EXCLUDED.location_metro,"
        "location_region=EXCLUDED.location_region,"
        "views_total=EXCLUDED.views_total,"
        "status=EXCLUDED.status,"
        "failure_reason=EXCLUDED.failure_reason,"
        "worker_id=EXCLUDED.worker_id,"
        "attempts=EXCLUDED.attempts,"
        "processed_at_ms=EXCLUDED.processed_at_ms,"
        "updated_at_ms=EXCLUDED.updated_at_ms",
        r.item_id, NullIfEmpty(r.title), NullIfEmpty(r.description), characteristics, r.price,
        NullIfEmpty(r.published_at), NullIfEmpty(r.seller_name), NullIfEmpty(r.seller_profile_url),
        NullIfEmpty(r.location_address), NullIfEmpty(r.location_metro), NullIfEmpty(r.location_region), r.views_total,
        std::string(fleetq::model::ToString(r.status)), NullIfEmpty(r.failure_reason), NullIfEmpty(r.worker_id),
        r.attempts, r.processed_at_ms, now_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ResultRecord> PgRepository::GetResult(Transaction& t, int64_t item_id) {
  return Guarded("get result", [&] {
    return FirstRow(
        TX(t).Work().exec_params(std::string("SELECT ") + kResultColumns + " FROM results WHERE item_id=$1", item_id),
        ReadResult);
  });
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

model::StatusCounts PgRepository::CollectStatus(Transaction& t, const model::HealthCutoffs& cutoffs) {
  return Guarded("collect status", [&] {
    auto& w = TX(t).Work();
    model::StatusCounts c;

    for (const auto& row : w.exec("SELECT status, COUNT(*) FROM tasks GROUP BY status")) {
      const auto status = Text(row[0]);
      const auto n      = row[1].as<uint64_t>();
      switch (ParseOrThrow(fleetq::model::ParseTaskStatus(status), status)) {
        case TaskStatus::kPending: c.tasks_pending = n; break;
        case TaskStatus::kProcessing: c.tasks_processing = n; break;
        case TaskStatus::kCompleted: c.tasks_completed = n; break;
        case TaskStatus::kFailed: c.tasks_failed = n; break;
      }
    }

    for (const auto& row : w.exec("SELECT status, COUNT(*) FROM proxies GROUP BY status")) {
      const auto status = Text(row[0]);
      const auto n      = row[1].as<uint64_t>();
      switch (ParseOrThrow(fleetq::model::ParseProxyStatus(status), status)) {
        case ProxyStatus::kAvailable: c.proxies_available = n; break;
        case ProxyStatus::kLocked: c.proxies_locked = n; break;
        case ProxyStatus::kBlocked: c.proxies_blocked = n; break;
      }
    }

    for (const auto& row : w.exec("SELECT status, COUNT(*) FROM workers GROUP BY status")) {
      const auto status = Text(row[0]);
      if (ParseOrThrow(fleetq::model::ParseWorkerStatus(status), status) == WorkerStatus::kActive) {
        c.workers_active = row[1].as<uint64_t>();
      } else {
        c.workers_stopped = row[1].as<uint64_t>();
      }
    }

    auto health = w.exec_params(
        "SELECT "
        "(SELECT COUNT(*) FROM tasks WHERE status='processing' AND last_attempt_at_ms < $1),"
        "(SELECT COUNT(*) FROM proxies WHERE status='locked' AND locked_at_ms < $2),"
        "(SELECT COUNT(*) FROM workers WHERE status='active' AND last_heartbeat_ms < $3),"
        "(SELECT COUNT(*) FROM results)",
        cutoffs.stale_task_before_ms, cutoffs.stale_lock_before_ms, cutoffs.dead_worker_before_ms);
    c.stuck_tasks   = health[0][0].as<uint64_t>();
    c.stuck_proxies = health[0][1].as<uint64_t>();
    c.dead_workers  = health[0][2].as<uint64_t>();
    c.results       = health[0][3].as<uint64_t>();
    return c;
  });
}

} // namespace fleetq::db::postgres
