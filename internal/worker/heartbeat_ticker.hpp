#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/stop_signal.hpp"

namespace fleetq::worker {

class WorkerRegistry;

/*
  Background thread refreshing the heartbeat of every live lane in the
  process. A failed refresh is logged and retried on the next tick.

  A lane is retired once it exits; Retire() waits out a pass in progress,
  so no heartbeat for that id lands after it returns. Start() after Stop()
  starts a fresh thread.
*/
class HeartbeatTicker {
 public:
  HeartbeatTicker(std::shared_ptr<WorkerRegistry> registry, std::vector<std::string> worker_ids,
                  std::chrono::milliseconds interval);
  ~HeartbeatTicker();

  void Start();
  void Stop();

  // Stops refreshing `worker_id`.
  void Retire(const std::string& worker_id);

  // One refresh pass; returns the number of ids refreshed.
  size_t TickOnce();

 private:
  void Loop();

  std::shared_ptr<WorkerRegistry> registry_;
  std::chrono::milliseconds       interval_;

  std::mutex               ids_mutex_;
  std::vector<std::string> worker_ids_;

  util::StopSignal  stop_;
  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace fleetq::worker
