#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/model/task_record.hpp"
#include "internal/proxy/proxy_lease.hpp"
#include "internal/util/stop_signal.hpp"
#include "internal/util/time.hpp"

namespace fleetq::queue {
class TaskQueue;
}
namespace fleetq::proxy {
class ProxyPool;
}
namespace fleetq::results {
class ResultStore;
}
namespace fleetq::processing {
class ProcessingSession;
class SessionFactory;
} // namespace fleetq::processing

namespace fleetq::worker {

class WorkerRegistry;

struct LaneOptions {
  // Wait between pool scans while every proxy is locked or blocked.
  std::chrono::milliseconds no_proxy_backoff{std::chrono::seconds(30)};

  // Recording steps (result, task transition, counters) are retried this
  // many times, store_retry_delay apart, before the lane gives up on them.
  uint32_t                  store_retry_attempts = 5;
  std::chrono::milliseconds store_retry_delay{std::chrono::seconds(10)};
};

// Shared by every lane of a process.
struct LaneServices {
  std::shared_ptr<queue::TaskQueue>           tasks;
  std::shared_ptr<proxy::ProxyPool>           proxies;
  std::shared_ptr<WorkerRegistry>             registry;
  std::shared_ptr<results::ResultStore>       results;
  std::shared_ptr<processing::SessionFactory> sessions;
  util::NowFn                                 now;

  // Called with the lane's worker id once it stops working, before the
  // registry marks it stopped. Optional.
  std::function<void(const std::string& worker_id)> retire;
};

struct LaneStats {
  uint64_t attempts        = 0;
  uint64_t completed       = 0;
  uint64_t failed_attempts = 0;
  uint64_t tasks_failed    = 0;
  uint64_t rotations       = 0;
  uint64_t proxy_waits     = 0;
  uint64_t requeued        = 0;
  uint64_t store_errors    = 0;

  LaneStats& operator+=(const LaneStats& other);
};

/*
  WorkerLoop

  One lane:

    claim task -> lease proxy -> process -> decide -> free proxy -> record

  until the queue has no pending task or the stop signal fires. A stop
  lets the current attempt finish; a task claimed but never attempted is
  handed back without consuming an attempt.

  The processing session and its proxy are kept across attempts until the
  outcome asks for rotation; the proxy itself is released after every
  attempt and reclaimed by id on the next one.
*/
class WorkerLoop {
 public:
  WorkerLoop(std::string worker_id, LaneServices services, LaneOptions options, util::StopSignal& stop);
  ~WorkerLoop();

  LaneStats Run();

  const std::string& WorkerId() const {
    return worker_id_;
  }

 private:
  // Returns false when the queue is drained or the lane must stop.
  bool RunOnce();

  std::optional<proxy::ProxyLease> AcquireProxy(const db::model::TaskRecord& task);

  void Attempt(const db::model::TaskRecord& task, proxy::ProxyLease& lease);

  // Releases the proxy, or counts a block against it when rotating.
  void FreeProxy(proxy::ProxyLease& lease, bool rotate);

  void DropSession();

  // Runs `step` with bounded retries. False when every try failed or the
  // stop signal fired between tries.
  bool Retrying(const char* step, const std::function<void()>& fn);

  std::string       worker_id_;
  LaneServices      services_;
  LaneOptions       options_;
  util::StopSignal& stop_;

  std::unique_ptr<processing::ProcessingSession> session_;
  std::optional<int64_t>                         session_proxy_id_;

  LaneStats stats_;
};

} // namespace fleetq::worker
