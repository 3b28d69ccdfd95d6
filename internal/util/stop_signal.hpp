#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace fleetq::util {

/*
  Shutdown flag with interruptible waits.

  Shared by worker lanes, the heartbeat ticker and the reaper so a single
  Trigger() wakes every sleeper instead of waiting out its interval.
*/
class StopSignal {
 public:
  void Trigger() {
    {
      std::lock_guard lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

  // Re-arms the flag. Only while nothing waits on it.
  void Reset() {
    std::lock_guard lock(mutex_);
    stopped_ = false;
  }

  bool Stopped() const {
    std::lock_guard lock(mutex_);
    return stopped_;
  }

  // Returns true when stopped before the timeout elapsed.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return stopped_; });
  }

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    stopped_ = false;
};

} // namespace fleetq::util
