#include "worker_loop.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/outcome/outcome_policy.hpp"
#include "internal/processing/session.hpp"
#include "internal/proxy/proxy_pool.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/results/result_store.hpp"
#include "internal/worker/worker_registry.hpp"

namespace fleetq::worker {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

LaneStats& LaneStats::operator+=(const LaneStats& other) {
  attempts += other.attempts;
  completed += other.completed;
  failed_attempts += other.failed_attempts;
  tasks_failed += other.tasks_failed;
  rotations += other.rotations;
  proxy_waits += other.proxy_waits;
  requeued += other.requeued;
  store_errors += other.store_errors;
  return *this;
}

WorkerLoop::WorkerLoop(std::string worker_id, LaneServices services, LaneOptions options, util::StopSignal& stop)
    : worker_id_(std::move(worker_id)), services_(std::move(services)), options_(options), stop_(stop) {
  if (options_.store_retry_attempts == 0) options_.store_retry_attempts = 1;
}

WorkerLoop::~WorkerLoop() = default;

LaneStats WorkerLoop::Run() {
  if (!Retrying("register", [&] { services_.registry->Register(worker_id_); })) {
    FLEETQ_LOG_ERROR("lane could not register", {StringField("worker_id", worker_id_)});
    if (services_.retire) services_.retire(worker_id_);
    return stats_;
  }
  FLEETQ_LOG_INFO("lane started", {StringField("worker_id", worker_id_)});

  while (!stop_.Stopped() && RunOnce()) {
  }

  DropSession();
  if (services_.retire) services_.retire(worker_id_);
  Retrying("mark stopped", [&] { services_.registry->MarkStopped(worker_id_); });

  FLEETQ_LOG_INFO("lane stopped",
                  {StringField("worker_id", worker_id_), IntField("attempts", static_cast<int64_t>(stats_.attempts)),
                   IntField("completed", static_cast<int64_t>(stats_.completed)),
                   IntField("failed_attempts", static_cast<int64_t>(stats_.failed_attempts)),
                   IntField("rotations", static_cast<int64_t>(stats_.rotations)),
                   IntField("store_errors", static_cast<int64_t>(stats_.store_errors))});
  return stats_;
}

bool WorkerLoop::RunOnce() {
  std::optional<db::model::TaskRecord> task;
  if (!Retrying("claim task", [&] { task = services_.tasks->Claim(worker_id_); })) return false;

  if (!task) {
    FLEETQ_LOG_INFO("no pending tasks", {StringField("worker_id", worker_id_)});
    return false;
  }
  FLEETQ_LOG_DEBUG("task claimed", {StringField("worker_id", worker_id_), IntField("task_id", task->id),
                                    IntField("item_id", task->item_id), IntField("attempts", task->attempts)});

  auto lease = AcquireProxy(*task);
  if (!lease) {
    // stopped before any attempt was made
    bool returned = false;
    if (Retrying("requeue task", [&] { returned = services_.tasks->Requeue(task->id, worker_id_); }) && returned) {
      ++stats_.requeued;
      FLEETQ_LOG_INFO("task requeued", {StringField("worker_id", worker_id_), IntField("item_id", task->item_id)});
    }
    return false;
  }

  Attempt(*task, *lease);
  return true;
}

std::optional<proxy::ProxyLease> WorkerLoop::AcquireProxy(const db::model::TaskRecord& task) {
  for (;;) {
    std::optional<proxy::ProxyLease> lease;
    const bool scanned = Retrying("claim proxy", [&] {
      lease = proxy::ProxyLease::Acquire(*services_.proxies, worker_id_, session_proxy_id_);
    });

    if (lease) {
      // preferred proxy was taken or blocked meanwhile
      if (session_proxy_id_ && *session_proxy_id_ != lease->Id()) DropSession();
      return lease;
    }

    if (scanned) {
      ++stats_.proxy_waits;
      FLEETQ_LOG_WARN("no proxy available, backing off",
                      {StringField("worker_id", worker_id_), IntField("item_id", task.item_id),
                       IntField("backoff_ms", options_.no_proxy_backoff.count())});
    }
    if (stop_.WaitFor(options_.no_proxy_backoff)) return std::nullopt;
  }
}

void WorkerLoop::Attempt(const db::model::TaskRecord& task, proxy::ProxyLease& lease) {
  ++stats_.attempts;

  outcome::ProcessingOutcome result;
  try {
    if (!session_) {
      session_          = services_.sessions->Open(lease.Endpoint());
      session_proxy_id_ = lease.Id();
    }
    result = session_->Process(task.item_id);
  } catch (const std::exception& e) {
    result                = outcome::ProcessingOutcome{};
    result.classification = outcome::Classification::kUnexpected;
    result.failure_reason = e.what();
    DropSession();
  }

  const auto decision = outcome::Decide(result);
  FLEETQ_LOG_INFO("task outcome",
                  {StringField("worker_id", worker_id_), IntField("item_id", task.item_id),
                   IntField("attempt", task.attempts + 1), IntField("proxy_id", lease.Id()),
                   StringField("classification", outcome::ToString(decision.effective)),
                   BoolField("terminal", decision.terminal), BoolField("rotate", decision.rotate)});

  // Proxy goes back before the outcome is recorded. Release and Block end
  // the hold before touching the store, so neither is retried; a lock left
  // behind is freed by the reaper.
  FreeProxy(lease, decision.rotate);

  if (decision.terminal) {
    const auto record = outcome::BuildResult(task, worker_id_, result, decision, util::ToUnixMillis(services_.now()));

    // result row before the task transition; a rerun overwrites it
    bool completed = false;
    if (Retrying("store result", [&] { services_.results->Upsert(record); }) &&
        Retrying("complete task", [&] { completed = services_.tasks->RecordSuccess(task.id, worker_id_); })) {
      if (completed) {
        ++stats_.completed;
      } else {
        FLEETQ_LOG_WARN("task no longer owned, result kept",
                        {StringField("worker_id", worker_id_), IntField("item_id", task.item_id)});
      }
    }
  } else {
    if (!result.failure_reason.empty()) {
      FLEETQ_LOG_WARN("attempt failed", {StringField("worker_id", worker_id_), IntField("item_id", task.item_id),
                                         StringField("reason", result.failure_reason)});
    }

    std::optional<db::model::TaskRecord> updated;
    if (Retrying("record attempt failure",
                 [&] { updated = services_.tasks->RecordAttemptFailure(task.id, worker_id_); })) {
      ++stats_.failed_attempts;
      if (!updated) {
        FLEETQ_LOG_WARN("task no longer owned", {StringField("worker_id", worker_id_), IntField("item_id", task.item_id)});
      } else if (updated->status == model::TaskStatus::kFailed) {
        ++stats_.tasks_failed;
        FLEETQ_LOG_WARN("task failed permanently",
                        {IntField("item_id", updated->item_id), IntField("attempts", updated->attempts),
                         IntField("max_attempts", updated->max_attempts)});
      }
    }
  }

  Retrying("record outcome", [&] { services_.registry->RecordOutcome(worker_id_, decision.terminal); });
}

void WorkerLoop::FreeProxy(proxy::ProxyLease& lease, bool rotate) {
  try {
    if (rotate) {
      ++stats_.rotations;
      DropSession();
      auto updated = lease.Block();
      if (updated && updated->status == model::ProxyStatus::kBlocked) {
        FLEETQ_LOG_WARN("proxy blocked", {IntField("proxy_id", updated->id), IntField("blocks", updated->blocks_count)});
      } else {
        FLEETQ_LOG_INFO("proxy rotated", {StringField("worker_id", worker_id_), IntField("proxy_id", lease.Id())});
      }
    } else {
      lease.Release();
    }
  } catch (const std::exception& e) {
    ++stats_.store_errors;
    FLEETQ_LOG_WARN("proxy release failed", {StringField("worker_id", worker_id_), IntField("proxy_id", lease.Id()),
                                             StringField("error", e.what())});
  }
}

void WorkerLoop::DropSession() {
  session_.reset();
  session_proxy_id_.reset();
}

bool WorkerLoop::Retrying(const char* step, const std::function<void()>& fn) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      fn();
      return true;
    } catch (const std::exception& e) {
      FLEETQ_LOG_WARN("store step failed", {StringField("worker_id", worker_id_), StringField("step", step),
                                            IntField("try", attempt), StringField("error", e.what())});
    }
    if (attempt >= options_.store_retry_attempts || stop_.WaitFor(options_.store_retry_delay)) {
      ++stats_.store_errors;
      FLEETQ_LOG_ERROR("store step abandoned", {StringField("worker_id", worker_id_), StringField("step", step)});
      return false;
    }
  }
}

} // namespace fleetq::worker
