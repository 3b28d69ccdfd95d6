#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/proxy_record.hpp"
#include "internal/db/model/result_record.hpp"
#include "internal/db/model/status_counts.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace fleetq::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Claim* never waits on a row leased by a concurrent transaction; such
    rows are skipped (postgres) or the writers are serialised (sqlite,
    memory)
  - Every state transition below is guarded by the row's current status
    (and holder where one exists); a guard miss returns std::nullopt
    instead of mutating

  The DB is the source of truth for:
    tasks, proxies, workers, results
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  // Inserts a pending task and fills in record.id. AlreadyExists when the
  // item id is already queued.
  virtual Result InsertTask(Transaction&, model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, int64_t task_id) = 0;

  virtual std::optional<model::TaskRecord> FindTaskByItem(Transaction&, int64_t item_id) = 0;

  // Oldest pending task (created_at_ms, id) -> processing.
  virtual std::optional<model::TaskRecord> ClaimTask(Transaction&, const std::string& worker_id, int64_t now_ms) = 0;

  // processing (owned by worker_id) -> completed, owner cleared.
  virtual std::optional<model::TaskRecord> CompleteTask(Transaction&, int64_t task_id, const std::string& worker_id,
                                                        int64_t now_ms) = 0;

  // processing (owned by worker_id) -> pending | failed, attempts += 1.
  virtual std::optional<model::TaskRecord> FailTaskAttempt(Transaction&, int64_t task_id, const std::string& worker_id) = 0;

  // processing (owned by worker_id) -> pending, attempts unchanged.
  virtual std::optional<model::TaskRecord> ReturnTask(Transaction&, int64_t task_id, const std::string& worker_id) = 0;

  // processing with last_attempt_at_ms < cutoff -> pending. Returns count.
  virtual uint64_t ReclaimStaleTasks(Transaction&, int64_t cutoff_ms) = 0;

  // pending with attempts >= max_attempts -> failed. Returns count.
  virtual uint64_t FailExhaustedTasks(Transaction&) = 0;

  // Removes every task whatever its status. Returns count.
  virtual uint64_t DeleteAllTasks(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Proxies
  // ---------------------------------------------------------------------

  virtual Result InsertProxy(Transaction&, model::ProxyRecord&) = 0;

  virtual std::optional<model::ProxyRecord> GetProxy(Transaction&, int64_t proxy_id) = 0;

  // Available proxy with the fewest blocks, then least used
  // (blocks_count, uses_count, id) -> locked, uses_count += 1.
  virtual std::optional<model::ProxyRecord> ClaimProxy(Transaction&, const std::string& worker_id, int64_t now_ms) = 0;

  // Same as ClaimProxy restricted to one row; nullopt when it is not available.
  virtual std::optional<model::ProxyRecord> ClaimProxyById(Transaction&, int64_t proxy_id, const std::string& worker_id,
                                                           int64_t now_ms) = 0;

  // locked by worker_id -> available.
  virtual std::optional<model::ProxyRecord> ReleaseProxy(Transaction&, int64_t proxy_id, const std::string& worker_id,
                                                         int64_t now_ms) = 0;

  // blocks_count += 1, then blocked when it reaches threshold, otherwise
  // available. Acts on rows locked by worker_id or already available.
  virtual std::optional<model::ProxyRecord> BlockProxy(Transaction&, int64_t proxy_id, const std::string& worker_id,
                                                       uint32_t threshold, int64_t now_ms) = 0;

  // locked with locked_at_ms < cutoff -> available. Returns count.
  virtual uint64_t ReclaimStaleProxies(Transaction&, int64_t cutoff_ms, int64_t now_ms) = 0;

  // Removes every proxy, locked ones included. Returns count.
  virtual uint64_t DeleteAllProxies(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Workers
  // ---------------------------------------------------------------------

  // Insert active row, or reactivate and refresh heartbeat.
  virtual Result UpsertWorker(Transaction&, const std::string& worker_id, int64_t now_ms) = 0;

  // last_heartbeat_ms = max(last_heartbeat_ms, now_ms), status -> active.
  // NotFound if absent.
  virtual Result TouchWorker(Transaction&, const std::string& worker_id, int64_t now_ms) = 0;

  virtual Result IncrementWorkerCounter(Transaction&, const std::string& worker_id, bool success) = 0;

  virtual Result StopWorker(Transaction&, const std::string& worker_id) = 0;

  virtual std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& worker_id) = 0;

  // active with last_heartbeat_ms < cutoff -> stopped. Returns count.
  virtual uint64_t StopDeadWorkers(Transaction&, int64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Results
  // ---------------------------------------------------------------------

  // Insert or overwrite by item_id. created_at_ms of an existing row is kept.
  virtual Result UpsertResult(Transaction&, const model::ResultRecord&, int64_t now_ms) = 0;

  virtual std::optional<model::ResultRecord> GetResult(Transaction&, int64_t item_id) = 0;

  // ---------------------------------------------------------------------
  // Status
  // ---------------------------------------------------------------------

  virtual model::StatusCounts CollectStatus(Transaction&, const model::HealthCutoffs&) = 0;
};

} // namespace fleetq::db
