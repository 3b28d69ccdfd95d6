#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include "internal/db/api/repository.hpp"
#include "internal/util/stop_signal.hpp"
#include "internal/util/time.hpp"

namespace fleetq::reaper {

struct ReaperOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  std::chrono::milliseconds stale_task_after{std::chrono::seconds(600)};
  std::chrono::milliseconds stale_lock_after{std::chrono::seconds(300)};
  std::chrono::milliseconds dead_worker_after{std::chrono::seconds(240)};
  uint32_t                  conflict_retries = 64;
};

struct SweepStats {
  uint64_t tasks_reclaimed   = 0;
  uint64_t proxies_reclaimed = 0;
  uint64_t workers_stopped   = 0;
  uint64_t tasks_failed      = 0;
  uint32_t sweep_errors      = 0;
};

/*
  Reaper

  Returns abandoned leases to the pool by elapsed time alone:

    processing tasks idle past stale_task_after -> pending (no attempt used)
    locked proxies idle past stale_lock_after   -> available
    active workers silent past dead_worker_after -> stopped
    pending tasks with attempts >= max_attempts  -> failed

  Each sweep commits on its own; one failing does not stop the others.
  Running several reapers at once is safe. Start() after Stop() resumes the
  loop on a new thread.
*/
class Reaper {
 public:
  Reaper(std::shared_ptr<db::Repository> repository, util::NowFn now, ReaperOptions options);
  ~Reaper();

  SweepStats SweepOnce();

  void Start();
  void Stop();

 private:
  void Loop();

  template <typename Sweep>
  uint64_t RunSweep(const char* name, SweepStats& stats, Sweep&& sweep);

  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
  ReaperOptions                   options_;

  util::StopSignal  stop_;
  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace fleetq::reaper
