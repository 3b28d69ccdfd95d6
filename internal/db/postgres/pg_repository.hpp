#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace fleetq::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTask(Transaction&, model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, int64_t task_id) override;
  std::optional<model::TaskRecord> FindTaskByItem(Transaction&, int64_t item_id) override;
  std::optional<model::TaskRecord> ClaimTask(Transaction&, const std::string& worker_id, int64_t now_ms) override;
  std::optional<model::TaskRecord> CompleteTask(Transaction&, int64_t task_id, const std::string& worker_id,
                                                int64_t now_ms) override;
  std::optional<model::TaskRecord> FailTaskAttempt(Transaction&, int64_t task_id, const std::string& worker_id) override;
  std::optional<model::TaskRecord> ReturnTask(Transaction&, int64_t task_id, const std::string& worker_id) override;
  uint64_t ReclaimStaleTasks(Transaction&, int64_t cutoff_ms) override;
  uint64_t FailExhaustedTasks(Transaction&) override;
  uint64_t DeleteAllTasks(Transaction&) override;

  Result InsertProxy(Transaction&, model::ProxyRecord&) override;
  std::optional<model::ProxyRecord> GetProxy(Transaction&, int64_t proxy_id) override;
  std::optional<model::ProxyRecord> ClaimProxy(Transaction&, const std::string& worker_id, int64_t now_ms) override;
  std::optional<model::ProxyRecord> ClaimProxyById(Transaction&, int64_t proxy_id, const std::string& worker_id,
                                                   int64_t now_ms) override;
  std::optional<model::ProxyRecord> ReleaseProxy(Transaction&, int64_t proxy_id, const std::string& worker_id,
                                                 int64_t now_ms) override;
  std::optional<model::ProxyRecord> BlockProxy(Transaction&, int64_t proxy_id, const std::string& worker_id,
                                               uint32_t threshold, int64_t now_ms) override;
  uint64_t ReclaimStaleProxies(Transaction&, int64_t cutoff_ms, int64_t now_ms) override;
  uint64_t DeleteAllProxies(Transaction&) override;

  Result UpsertWorker(Transaction&, const std::string& worker_id, int64_t now_ms) override;
  Result TouchWorker(Transaction&, const std::string& worker_id, int64_t now_ms) override;
  Result IncrementWorkerCounter(Transaction&, const std::string& worker_id, bool success) override;
  Result StopWorker(Transaction&, const std::string& worker_id) override;
  std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& worker_id) override;
  uint64_t StopDeadWorkers(Transaction&, int64_t cutoff_ms) override;

  Result UpsertResult(Transaction&, const model::ResultRecord&, int64_t now_ms) override;
  std::optional<model::ResultRecord> GetResult(Transaction&, int64_t item_id) override;

  model::StatusCounts CollectStatus(Transaction&, const model::HealthCutoffs&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
