#pragma once

#include <iosfwd>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/status_counts.hpp"
#include "internal/util/time.hpp"

namespace fleetq::service {

struct HealthThresholds {
  std::chrono::milliseconds stale_task_after{std::chrono::seconds(600)};
  std::chrono::milliseconds stale_lock_after{std::chrono::seconds(300)};
  std::chrono::milliseconds dead_worker_after{std::chrono::seconds(240)};
};

/*
  Operator view of the store: counts per status plus rows the reaper would
  act on right now.
*/
class StatusService {
 public:
  StatusService(std::shared_ptr<db::Repository> repository, util::NowFn now, HealthThresholds thresholds);

  db::model::StatusCounts Snapshot();

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
  HealthThresholds                thresholds_;
};

void PrintStatus(std::ostream& out, const db::model::StatusCounts& counts);

} // namespace fleetq::service
