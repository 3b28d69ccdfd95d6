#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace fleetq::testing {

/*
  Forwards every call to an inner repository. A test can hook result upserts
  to look at the store mid-transaction, or make them fail outright.
*/
class InterceptingRepository final : public db::Repository {
 public:
  using UpsertHook = std::function<db::Result(db::Repository& inner, db::Transaction& tx)>;

  explicit InterceptingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  // Runs before each result upsert; a non-OK return replaces the upsert.
  void OnUpsertResult(UpsertHook hook) {
    upsert_hook_ = std::move(hook);
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertTask(db::Transaction& tx, db::model::TaskRecord& r) override {
    return inner_->InsertTask(tx, r);
  }
  std::optional<db::model::TaskRecord> GetTask(db::Transaction& tx, int64_t task_id) override {
    return inner_->GetTask(tx, task_id);
  }
  std::optional<db::model::TaskRecord> FindTaskByItem(db::Transaction& tx, int64_t item_id) override {
    return inner_->FindTaskByItem(tx, item_id);
  }
  std::optional<db::model::TaskRecord> ClaimTask(db::Transaction& tx, const std::string& worker_id,
                                                 int64_t now_ms) override {
    return inner_->ClaimTask(tx, worker_id, now_ms);
  }
  std::optional<db::model::TaskRecord> CompleteTask(db::Transaction& tx, int64_t task_id, const std::string& worker_id,
                                                    int64_t now_ms) override {
    return inner_->CompleteTask(tx, task_id, worker_id, now_ms);
  }
  std::optional<db::model::TaskRecord> FailTaskAttempt(db::Transaction& tx, int64_t task_id,
                                                       const std::string& worker_id) override {
    return inner_->FailTaskAttempt(tx, task_id, worker_id);
  }
  std::optional<db::model::TaskRecord> ReturnTask(db::Transaction& tx, int64_t task_id,
                                                  const std::string& worker_id) override {
    return inner_->ReturnTask(tx, task_id, worker_id);
  }
  uint64_t ReclaimStaleTasks(db::Transaction& tx, int64_t cutoff_ms) override {
    return inner_->ReclaimStaleTasks(tx, cutoff_ms);
  }
  uint64_t FailExhaustedTasks(db::Transaction& tx) override {
    return inner_->FailExhaustedTasks(tx);
  }
  uint64_t DeleteAllTasks(db::Transaction& tx) override {
    return inner_->DeleteAllTasks(tx);
  }

  db::Result InsertProxy(db::Transaction& tx, db::model::ProxyRecord& r) override {
    return inner_->InsertProxy(tx, r);
  }
  std::optional<db::model::ProxyRecord> GetProxy(db::Transaction& tx, int64_t proxy_id) override {
    return inner_->GetProxy(tx, proxy_id);
  }
  std::optional<db::model::ProxyRecord> ClaimProxy(db::Transaction& tx, const std::string& worker_id,
                                                   int64_t now_ms) override {
    return inner_->ClaimProxy(tx, worker_id, now_ms);
  }
  std::optional<db::model::ProxyRecord> ClaimProxyById(db::Transaction& tx, int64_t proxy_id,
                                                       const std::string& worker_id, int64_t now_ms) override {
    return inner_->ClaimProxyById(tx, proxy_id, worker_id, now_ms);
  }
  std::optional<db::model::ProxyRecord> ReleaseProxy(db::Transaction& tx, int64_t proxy_id,
                                                     const std::string& worker_id, int64_t now_ms) override {
    return inner_->ReleaseProxy(tx, proxy_id, worker_id, now_ms);
  }
  std::optional<db::model::ProxyRecord> BlockProxy(db::Transaction& tx, int64_t proxy_id, const std::string& worker_id,
                                                   uint32_t threshold, int64_t now_ms) override {
    return inner_->BlockProxy(tx, proxy_id, worker_id, threshold, now_ms);
  }
  uint64_t ReclaimStaleProxies(db::Transaction& tx, int64_t cutoff_ms, int64_t now_ms) override {
    return inner_->ReclaimStaleProxies(tx, cutoff_ms, now_ms);
  }
  uint64_t DeleteAllProxies(db::Transaction& tx) override {
    return inner_->DeleteAllProxies(tx);
  }

  db::Result UpsertWorker(db::Transaction& tx, const std::string& worker_id, int64_t now_ms) override {
    return inner_->UpsertWorker(tx, worker_id, now_ms);
  }
  db::Result TouchWorker(db::Transaction& tx, const std::string& worker_id, int64_t now_ms) override {
    return inner_->TouchWorker(tx, worker_id, now_ms);
  }
  db::Result IncrementWorkerCounter(db::Transaction& tx, const std::string& worker_id, bool success) override {
    return inner_->IncrementWorkerCounter(tx, worker_id, success);
  }
  db::Result StopWorker(db::Transaction& tx, const std::string& worker_id) override {
    return inner_->StopWorker(tx, worker_id);
  }
  std::optional<db::model::WorkerRecord> GetWorker(db::Transaction& tx, const std::string& worker_id) override {
    return inner_->GetWorker(tx, worker_id);
  }
  uint64_t StopDeadWorkers(db::Transaction& tx, int64_t cutoff_ms) override {
    return inner_->StopDeadWorkers(tx, cutoff_ms);
  }

  db::Result UpsertResult(db::Transaction& tx, const db::model::ResultRecord& r, int64_t now_ms) override {
    if (upsert_hook_) {
      auto hooked = upsert_hook_(*inner_, tx);
      if (!hooked) return hooked;
    }
    return inner_->UpsertResult(tx, r, now_ms);
  }
  std::optional<db::model::ResultRecord> GetResult(db::Transaction& tx, int64_t item_id) override {
    return inner_->GetResult(tx, item_id);
  }

  db::model::StatusCounts CollectStatus(db::Transaction& tx, const db::model::HealthCutoffs& cutoffs) override {
    return inner_->CollectStatus(tx, cutoffs);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
  UpsertHook                      upsert_hook_;
};

} // namespace fleetq::testing
