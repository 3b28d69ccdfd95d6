#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace fleetq::db::memory {

namespace {

using fleetq::model::ProxyStatus;
using fleetq::model::TaskStatus;
using fleetq::model::WorkerStatus;

bool OwnsProcessing(const model::TaskRecord& task, const std::string& worker_id) {
  return task.status == TaskStatus::kProcessing && task.worker_id == worker_id;
}

void LockProxy(model::ProxyRecord& proxy, const std::string& worker_id, int64_t now_ms) {
  proxy.status       = ProxyStatus::kLocked;
  proxy.locked_by    = worker_id;
  proxy.locked_at_ms = now_ms;
  proxy.uses_count++;
  proxy.last_used_at_ms = now_ms;
}

void UnlockProxy(model::ProxyRecord& proxy) {
  proxy.locked_by.clear();
  proxy.locked_at_ms = 0;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------------
// Tasks
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
  if (TX(t).View().task_by_item.contains(r.item_id)) return Result::Err(ErrorCode::AlreadyExists);

  auto& s = TX(t).Mutable();
  r.id    = s.next_task_id++;
  s.tasks[r.id]               = r;
  s.task_by_item[r.item_id]   = r.id;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, int64_t task_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(task_id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

std::optional<model::TaskRecord> MemoryRepository::FindTaskByItem(Transaction& t, int64_t item_id) {
  const auto& s  = TX(t).View();
  auto        it = s.task_by_item.find(item_id);
  if (it == s.task_by_item.end()) return std::nullopt;
  return s.tasks.at(it->second);
}

std::optional<model::TaskRecord> MemoryRepository::ClaimTask(Transaction& t, const std::string& worker_id,
                                                             int64_t now_ms) {
  const auto& view = TX(t).View();

  const model::TaskRecord* oldest = nullptr;
  for (const auto& [_, task] : view.tasks) {
    if (task.status != TaskStatus::kPending) continue;
    // map iterates by id, so strict < keeps the lowest id on ties
    if (!oldest || task.created_at_ms < oldest->created_at_ms) oldest = &task;
  }
  if (!oldest) return std::nullopt;

  const int64_t id   = oldest->id;
  auto&         task = TX(t).Mutable().tasks.at(id);
  task.status             = TaskStatus::kProcessing;
  task.worker_id          = worker_id;
  task.last_attempt_at_ms = now_ms;
  return task;
}

std::optional<model::TaskRecord> MemoryRepository::CompleteTask(Transaction& t, int64_t task_id,
                                                                const std::string& worker_id, int64_t now_ms) {
  auto current = GetTask(t, task_id);
  if (!current || !OwnsProcessing(*current, worker_id)) return std::nullopt;

  auto& task = TX(t).Mutable().tasks.at(task_id);
  task.status          = TaskStatus::kCompleted;
  task.completed_at_ms = now_ms;
  task.worker_id.clear();
  return task;
}

std::optional<model::TaskRecord> MemoryRepository::FailTaskAttempt(Transaction& t, int64_t task_id,
                                                                   const std::string& worker_id) {
  auto current = GetTask(t, task_id);
  if (!current || !OwnsProcessing(*current, worker_id)) return std::nullopt;

  auto& task = TX(t).Mutable().tasks.at(task_id);
  task.attempts++;
  task.status = task.attempts >= task.max_attempts ? TaskStatus::kFailed : TaskStatus::kPending;
  task.worker_id.clear();
  return task;
}

std::optional<model::TaskRecord> MemoryRepository::ReturnTask(Transaction& t, int64_t task_id,
                                                              const std::string& worker_id) {
  auto current = GetTask(t, task_id);
  if (!current || !OwnsProcessing(*current, worker_id)) return std::nullopt;

  auto& task  = TX(t).Mutable().tasks.at(task_id);
  task.status = TaskStatus::kPending;
  task.worker_id.clear();
  return task;
}

uint64_t MemoryRepository::ReclaimStaleTasks(Transaction& t, int64_t cutoff_ms) {
  const auto& view = TX(t).View();
  const bool  any  = std::any_of(view.tasks.begin(), view.tasks.end(), [&](const auto& kv) {
    return kv.second.status == TaskStatus::kProcessing && kv.second.last_attempt_at_ms < cutoff_ms;
  });
  if (!any) return 0;

  uint64_t n = 0;
  for (auto& [_, task] : TX(t).Mutable().tasks) {
    if (task.status != TaskStatus::kProcessing || task.last_attempt_at_ms >= cutoff_ms) continue;
    task.status = TaskStatus::kPending;
    task.worker_id.clear();
    ++n;
  }
  return n;
}

uint64_t MemoryRepository::FailExhaustedTasks(Transaction& t) {
  const auto& view = TX(t).View();
  const bool  any  = std::any_of(view.tasks.begin(), view.tasks.end(), [](const auto& kv) {
    return kv.second.status == TaskStatus::kPending && kv.second.attempts >= kv.second.max_attempts;
  });
  if (!any) return 0;

  uint64_t n = 0;
  for (auto& [_, task] : TX(t).Mutable().tasks) {
    if (task.status != TaskStatus::kPending || task.attempts < task.max_attempts) continue;
    task.status = TaskStatus::kFailed;
    ++n;
  }
  return n;
}

uint64_t MemoryRepository::DeleteAllTasks(Transaction& t) {
  if (TX(t).View().tasks.empty()) return 0;

  auto&      s = TX(t).Mutable();
  const auto n = static_cast<uint64_t>(s.tasks.size());
  s.tasks.clear();
  s.task_by_item.clear();
  return n;
}

// ---------------------------------------------------------------------------
// Proxies
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertProxy(Transaction& t, model::ProxyRecord& r) {
  if (TX(t).View().proxy_by_address.contains(r.proxy)) return Result::Err(ErrorCode::AlreadyExists);

  auto& s = TX(t).Mutable();
  r.id    = s.next_proxy_id++;
  s.proxies[r.id]              = r;
  s.proxy_by_address[r.proxy]  = r.id;
  return Result::Ok();
}

std::optional<model::ProxyRecord> MemoryRepository::GetProxy(Transaction& t, int64_t proxy_id) {
  const auto& s  = TX(t).View();
  auto        it = s.proxies.find(proxy_id);
  if (it == s.proxies.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ProxyRecord> MemoryRepository::ClaimProxy(Transaction& t, const std::string& worker_id,
                                                               int64_t now_ms) {
  const auto& view = TX(t).View();

  // fewest blocks first, then least used; ties go to the lower id
  const model::ProxyRecord* least = nullptr;
  for (const auto& [_, proxy] : view.proxies) {
    if (proxy.status != ProxyStatus::kAvailable) continue;
    if (!least || std::tie(proxy.blocks_count, proxy.uses_count) < std::tie(least->blocks_count, least->uses_count)) {
      least = &proxy;
    }
  }
  if (!least) return std::nullopt;

  auto& proxy = TX(t).Mutable().proxies.at(least->id);
  LockProxy(proxy, worker_id, now_ms);
  return proxy;
}

std::optional<model::ProxyRecord> MemoryRepository::ClaimProxyById(Transaction& t, int64_t proxy_id,
                                                                   const std::string& worker_id, int64_t now_ms) {
  auto current = GetProxy(t, proxy_id);
  if (!current || current->status != ProxyStatus::kAvailable) return std::nullopt;

  auto& proxy = TX(t).Mutable().proxies.at(proxy_id);
  LockProxy(proxy, worker_id, now_ms);
  return proxy;
}

std::optional<model::ProxyRecord> MemoryRepository::ReleaseProxy(Transaction& t, int64_t proxy_id,
                                                                 const std::string& worker_id, int64_t now_ms) {
  auto current = GetProxy(t, proxy_id);
  if (!current || current->status != ProxyStatus::kLocked || current->locked_by != worker_id) return std::nullopt;

  auto& proxy  = TX(t).Mutable().proxies.at(proxy_id);
  proxy.status = ProxyStatus::kAvailable;
  UnlockProxy(proxy);
  proxy.last_used_at_ms = now_ms;
  return proxy;
}

std::optional<model::ProxyRecord> MemoryRepository::BlockProxy(Transaction& t, int64_t proxy_id,
                                                               const std::string& worker_id, uint32_t threshold,
                                                               int64_t now_ms) {
  auto current = GetProxy(t, proxy_id);
  if (!current) return std::nullopt;
  const bool held_by_caller = current->status == ProxyStatus::kLocked && current->locked_by == worker_id;
  if (!held_by_caller && current->status != ProxyStatus::kAvailable) return std::nullopt;

  auto& proxy = TX(t).Mutable().proxies.at(proxy_id);
  proxy.blocks_count++;
  proxy.status = proxy.blocks_count >= threshold ? ProxyStatus::kBlocked : ProxyStatus::kAvailable;
  UnlockProxy(proxy);
  proxy.last_used_at_ms = now_ms;
  return proxy;
}

uint64_t MemoryRepository::ReclaimStaleProxies(Transaction& t, int64_t cutoff_ms, int64_t now_ms) {
  const auto& view = TX(t).View();
  const bool  any  = std::any_of(view.proxies.begin(), view.proxies.end(), [&](const auto& kv) {
    return kv.second.status == ProxyStatus::kLocked && kv.second.locked_at_ms < cutoff_ms;
  });
  if (!any) return 0;

  uint64_t n = 0;
  for (auto& [_, proxy] : TX(t).Mutable().proxies) {
    if (proxy.status != ProxyStatus::kLocked || proxy.locked_at_ms >= cutoff_ms) continue;
    proxy.status = ProxyStatus::kAvailable;
    UnlockProxy(proxy);
    proxy.last_used_at_ms = now_ms;
    ++n;
  }
  return n;
}

uint64_t MemoryRepository::DeleteAllProxies(Transaction& t) {
  if (TX(t).View().proxies.empty()) return 0;

  auto&      s = TX(t).Mutable();
  const auto n = static_cast<uint64_t>(s.proxies.size());
  s.proxies.clear();
  s.proxy_by_address.clear();
  return n;
}

// ---------------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertWorker(Transaction& t, const std::string& worker_id, int64_t now_ms) {
  auto& workers = TX(t).Mutable().workers;
  auto  it      = workers.find(worker_id);
  if (it == workers.end()) {
    model::WorkerRecord w;
    w.worker_id         = worker_id;
    w.status            = WorkerStatus::kActive;
    w.started_at_ms     = now_ms;
    w.last_heartbeat_ms = now_ms;
    workers.emplace(worker_id, std::move(w));
    return Result::Ok();
  }

  it->second.status            = WorkerStatus::kActive;
  it->second.last_heartbeat_ms = std::max(it->second.last_heartbeat_ms, now_ms);
  return Result::Ok();
}

Result MemoryRepository::TouchWorker(Transaction& t, const std::string& worker_id, int64_t now_ms) {
  if (!TX(t).View().workers.contains(worker_id)) return Result::Err(ErrorCode::NotFound, worker_id);

  auto& w             = TX(t).Mutable().workers.at(worker_id);
  w.status            = WorkerStatus::kActive;
  w.last_heartbeat_ms = std::max(w.last_heartbeat_ms, now_ms);
  return Result::Ok();
}

Result MemoryRepository::IncrementWorkerCounter(Transaction& t, const std::string& worker_id, bool success) {
  if (!TX(t).View().workers.contains(worker_id)) return Result::Err(ErrorCode::NotFound, worker_id);

  auto& w = TX(t).Mutable().workers.at(worker_id);
  if (success) {
    w.tasks_processed++;
  } else {
    w.tasks_failed++;
  }
  return Result::Ok();
}

Result MemoryRepository::StopWorker(Transaction& t, const std::string& worker_id) {
  if (!TX(t).View().workers.contains(worker_id)) return Result::Err(ErrorCode::NotFound, worker_id);

  TX(t).Mutable().workers.at(worker_id).status = WorkerStatus::kStopped;
  return Result::Ok();
}

std::optional<model::WorkerRecord> MemoryRepository::GetWorker(Transaction& t, const std::string& worker_id) {
  const auto& s  = TX(t).View();
  auto        it = s.workers.find(worker_id);
  if (it == s.workers.end()) return std::nullopt;
  return it->second;
}

uint64_t MemoryRepository::StopDeadWorkers(Transaction& t, int64_t cutoff_ms) {
  const auto& view = TX(t).View();
  const bool  any  = std::any_of(view.workers.begin(), view.workers.end(), [&](const auto& kv) {
    return kv.second.status == WorkerStatus::kActive && kv.second.last_heartbeat_ms < cutoff_ms;
  });
  if (!any) return 0;

  uint64_t n = 0;
  for (auto& [_, w] : TX(t).Mutable().workers) {
    if (w.status != WorkerStatus::kActive || w.last_heartbeat_ms >= cutoff_ms) continue;
    w.status = WorkerStatus::kStopped;
    ++n;
  }
  return n;
}

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertResult(Transaction& t, const model::ResultRecord& r, int64_t now_ms) {
  auto& results = TX(t).Mutable().results;

  model::ResultRecord row = r;
  row.updated_at_ms       = now_ms;

  auto it = results.find(r.item_id);
  if (it != results.end()) {
    row.created_at_ms = it->second.created_at_ms;
    it->second        = std::move(row);
  } else {
    row.created_at_ms = now_ms;
    results.emplace(r.item_id, std::move(row));
  }
  return Result::Ok();
}

std::optional<model::ResultRecord> MemoryRepository::GetResult(Transaction& t, int64_t item_id) {
  const auto& s  = TX(t).View();
  auto        it = s.results.find(item_id);
  if (it == s.results.end()) return std::nullopt;
  return it->second;
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

model::StatusCounts MemoryRepository::CollectStatus(Transaction& t, const model::HealthCutoffs& cutoffs) {
  const auto&         s = TX(t).View();
  model::StatusCounts c;

  for (const auto& [_, task] : s.tasks) {
    switch (task.status) {
      case TaskStatus::kPending:
        c.tasks_pending++;
        break;
      case TaskStatus::kProcessing:
        c.tasks_processing++;
        if (task.last_attempt_at_ms < cutoffs.stale_task_before_ms) c.stuck_tasks++;
        break;
      case TaskStatus::kCompleted:
        c.tasks_completed++;
        break;
      case TaskStatus::kFailed:
        c.tasks_failed++;
        break;
    }
  }

  for (const auto& [_, proxy] : s.proxies) {
    switch (proxy.status) {
      case ProxyStatus::kAvailable:
        c.proxies_available++;
        break;
      case ProxyStatus::kLocked:
        c.proxies_locked++;
        if (proxy.locked_at_ms < cutoffs.stale_lock_before_ms) c.stuck_proxies++;
        break;
      case ProxyStatus::kBlocked:
        c.proxies_blocked++;
        break;
    }
  }

  for (const auto& [_, w] : s.workers) {
    if (w.status == WorkerStatus::kActive) {
      c.workers_active++;
      if (w.last_heartbeat_ms < cutoffs.dead_worker_before_ms) c.dead_workers++;
    } else {
      c.workers_stopped++;
    }
  }

  c.results = s.results.size();
  return c;
}

} // namespace fleetq::db::memory
