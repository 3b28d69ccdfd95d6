#include "status_service.hpp"

#include <chrono>
#include <ostream>

#include "internal/db/api/transaction_runner.hpp"
#include "internal/observability/logging.hpp"

namespace fleetq::service {

StatusService::StatusService(std::shared_ptr<db::Repository> repository, util::NowFn now, HealthThresholds thresholds)
    : repository_(std::move(repository)), now_(std::move(now)), thresholds_(thresholds) {
}

db::model::StatusCounts StatusService::Snapshot() {
  const auto started_at = std::chrono::steady_clock::now();
  const auto now_ms     = util::ToUnixMillis(now_());

  db::model::HealthCutoffs cutoffs;
  cutoffs.stale_task_before_ms  = now_ms - thresholds_.stale_task_after.count();
  cutoffs.stale_lock_before_ms  = now_ms - thresholds_.stale_lock_after.count();
  cutoffs.dead_worker_before_ms = now_ms - thresholds_.dead_worker_after.count();

  auto counts = db::RunInTransaction(*repository_, 1, [&](db::Transaction& tx) {
    return repository_->CollectStatus(tx, cutoffs);
  });

  FLEETQ_LOG_DEBUG("status snapshot",
                   {observability::IntField("elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                                              std::chrono::steady_clock::now() - started_at)
                                                              .count())});
  return counts;
}

void PrintStatus(std::ostream& out, const db::model::StatusCounts& c) {
  const auto tasks_total   = c.tasks_pending + c.tasks_processing + c.tasks_completed + c.tasks_failed;
  const auto proxies_total = c.proxies_available + c.proxies_locked + c.proxies_blocked;

  out << "tasks      total=" << tasks_total << " pending=" << c.tasks_pending << " processing=" << c.tasks_processing
      << " completed=" << c.tasks_completed << " failed=" << c.tasks_failed << '\n';
  out << "proxies    total=" << proxies_total << " available=" << c.proxies_available << " locked=" << c.proxies_locked
      << " blocked=" << c.proxies_blocked << '\n';
  out << "workers    active=" << c.workers_active << " stopped=" << c.workers_stopped << '\n';
  out << "results    total=" << c.results << '\n';
  out << "health     stuck_tasks=" << c.stuck_tasks << " stuck_proxies=" << c.stuck_proxies
      << " dead_workers=" << c.dead_workers << '\n';
}

} // namespace fleetq::service
