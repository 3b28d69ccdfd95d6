#pragma once

#include <cstdint>

namespace fleetq::db::model {

// Rows older than these cutoffs count as stuck / dead.
struct HealthCutoffs {
  int64_t stale_task_before_ms  = 0;
  int64_t stale_lock_before_ms  = 0;
  int64_t dead_worker_before_ms = 0;
};

struct StatusCounts {
  uint64_t tasks_pending    = 0;
  uint64_t tasks_processing = 0;
  uint64_t tasks_completed  = 0;
  uint64_t tasks_failed     = 0;

  uint64_t proxies_available = 0;
  uint64_t proxies_locked    = 0;
  uint64_t proxies_blocked   = 0;

  uint64_t workers_active  = 0;
  uint64_t workers_stopped = 0;

  uint64_t stuck_tasks   = 0;
  uint64_t stuck_proxies = 0;
  uint64_t dead_workers  = 0;

  uint64_t results = 0;
};

} // namespace fleetq::db::model
