#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace fleetq::db::model {

struct WorkerRecord {
  std::string worker_id; // program:host:pid:run:lane

  fleetq::model::WorkerStatus status = fleetq::model::WorkerStatus::kActive;

  uint64_t tasks_processed = 0;
  uint64_t tasks_failed    = 0;

  int64_t started_at_ms     = 0;
  int64_t last_heartbeat_ms = 0;
};

} // namespace fleetq::db::model
