#include "reaper.hpp"

#include <exception>

#include "internal/db/api/transaction_runner.hpp"
#include "internal/observability/logging.hpp"

namespace fleetq::reaper {

Reaper::Reaper(std::shared_ptr<db::Repository> repository, util::NowFn now, ReaperOptions options)
    : repository_(std::move(repository)), now_(std::move(now)), options_(options) {
}

Reaper::~Reaper() {
  Stop();
}

template <typename Sweep>
uint64_t Reaper::RunSweep(const char* name, SweepStats& stats, Sweep&& sweep) {
  try {
    return db::RunInTransaction(*repository_, options_.conflict_retries, sweep);
  } catch (const std::exception& e) {
    ++stats.sweep_errors;
    FLEETQ_LOG_ERROR("reaper sweep failed",
                     {observability::StringField("sweep", name), observability::StringField("error", e.what())});
    return 0;
  }
}

SweepStats Reaper::SweepOnce() {
  const int64_t now_ms = util::ToUnixMillis(now_());
  SweepStats    stats;

  stats.tasks_reclaimed = RunSweep("stale_tasks", stats, [&](db::Transaction& tx) {
    return repository_->ReclaimStaleTasks(tx, now_ms - options_.stale_task_after.count());
  });

  stats.proxies_reclaimed = RunSweep("stale_proxies", stats, [&](db::Transaction& tx) {
    return repository_->ReclaimStaleProxies(tx, now_ms - options_.stale_lock_after.count(), now_ms);
  });

  stats.workers_stopped = RunSweep("dead_workers", stats, [&](db::Transaction& tx) {
    return repository_->StopDeadWorkers(tx, now_ms - options_.dead_worker_after.count());
  });

  stats.tasks_failed = RunSweep("exhausted_tasks", stats, [&](db::Transaction& tx) {
    return repository_->FailExhaustedTasks(tx);
  });

  const bool acted = stats.tasks_reclaimed || stats.proxies_reclaimed || stats.workers_stopped || stats.tasks_failed;
  auto       log   = acted ? observability::LogInfo : observability::LogDebug;
  log("reaper sweep",
      {observability::IntField("tasks_reclaimed", static_cast<int64_t>(stats.tasks_reclaimed)),
       observability::IntField("proxies_reclaimed", static_cast<int64_t>(stats.proxies_reclaimed)),
       observability::IntField("workers_stopped", static_cast<int64_t>(stats.workers_stopped)),
       observability::IntField("tasks_failed", static_cast<int64_t>(stats.tasks_failed)),
       observability::IntField("errors", stats.sweep_errors)});
  return stats;
}

void Reaper::Start() {
  if (running_.exchange(true)) return;
  stop_.Reset();
  thread_ = std::thread(&Reaper::Loop, this);
}

void Reaper::Stop() {
  stop_.Trigger();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void Reaper::Loop() {
  FLEETQ_LOG_INFO("reaper started", {observability::IntField("interval_ms", options_.interval.count())});
  do {
    SweepOnce();
  } while (!stop_.WaitFor(options_.interval));
  FLEETQ_LOG_INFO("reaper stopped");
}

} // namespace fleetq::reaper
