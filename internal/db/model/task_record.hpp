#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace fleetq::db::model {

/*
  Persistent task row.

  IMPORTANT:
  - status=processing implies worker_id and last_attempt_at_ms are set.
  - attempts counts recorded failures only; a reaper reclaim does not
    consume one.
  - Empty worker_id / zero *_ms mean NULL in the store.
*/

struct TaskRecord {
  int64_t id      = 0;
  int64_t item_id = 0; // external identity, unique

  fleetq::model::TaskStatus status = fleetq::model::TaskStatus::kPending;

  std::string worker_id;

  uint32_t attempts     = 0;
  uint32_t max_attempts = 5;

  int64_t created_at_ms      = 0;
  int64_t last_attempt_at_ms = 0;
  int64_t completed_at_ms    = 0;
};

} // namespace fleetq::db::model
