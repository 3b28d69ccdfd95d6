#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/reaper/reaper.hpp"
#include "internal/util/stop_signal.hpp"
#include "internal/worker/worker_loop.hpp"

namespace fleetq::runtime {

struct FleetOptions {
  std::string               program_id = "fleetq_worker";
  uint32_t                  lanes      = 15;
  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
  worker::LaneOptions       lane;

  // Set when the reaper runs inside this process.
  std::optional<reaper::ReaperOptions> embedded_reaper;
};

/*
  Fleet

  One process worth of lanes: a WorkerLoop thread per lane, one heartbeat
  ticker covering all of them and optionally an embedded reaper.

  Run() blocks until every lane has exited, either because the queue ran
  dry or because Stop() was called. A lane that dies of a non-standard
  exception is rethrown from Run() once the others have joined.
*/
class Fleet {
 public:
  Fleet(std::shared_ptr<db::Repository> repository, worker::LaneServices services, FleetOptions options);

  Fleet(const Fleet&)            = delete;
  Fleet& operator=(const Fleet&) = delete;

  worker::LaneStats Run();

  // Safe from any thread, including a signal watcher.
  void Stop();

  bool Stopped() const {
    return stop_.Stopped();
  }

  const std::vector<std::string>& WorkerIds() const {
    return worker_ids_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  worker::LaneServices            services_;
  FleetOptions                    options_;
  std::vector<std::string>        worker_ids_;

  util::StopSignal stop_;
};

} // namespace fleetq::runtime
