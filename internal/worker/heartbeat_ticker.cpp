#include "heartbeat_ticker.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/worker/worker_registry.hpp"

namespace fleetq::worker {

HeartbeatTicker::HeartbeatTicker(std::shared_ptr<WorkerRegistry> registry, std::vector<std::string> worker_ids,
                                 std::chrono::milliseconds interval)
    : registry_(std::move(registry)), interval_(interval), worker_ids_(std::move(worker_ids)) {
}

HeartbeatTicker::~HeartbeatTicker() {
  Stop();
}

void HeartbeatTicker::Start() {
  if (running_.exchange(true)) return;
  stop_.Reset();
  thread_ = std::thread(&HeartbeatTicker::Loop, this);
}

void HeartbeatTicker::Stop() {
  stop_.Trigger();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void HeartbeatTicker::Retire(const std::string& worker_id) {
  std::lock_guard lock(ids_mutex_);
  worker_ids_.erase(std::remove(worker_ids_.begin(), worker_ids_.end(), worker_id), worker_ids_.end());
}

size_t HeartbeatTicker::TickOnce() {
  std::lock_guard lock(ids_mutex_);
  size_t          refreshed = 0;
  for (const auto& id : worker_ids_) {
    try {
      registry_->Heartbeat(id);
      ++refreshed;
    } catch (const std::exception& e) {
      FLEETQ_LOG_WARN("heartbeat failed",
                      {observability::StringField("worker_id", id), observability::StringField("error", e.what())});
    }
  }
  return refreshed;
}

void HeartbeatTicker::Loop() {
  while (!stop_.WaitFor(interval_)) {
    TickOnce();
  }
}

} // namespace fleetq::worker
