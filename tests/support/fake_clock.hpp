#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "internal/util/time.hpp"

namespace fleetq::testing {

// Manually driven clock; Fn() hands out a NowFn bound to this instance.
class FakeClock {
 public:
  explicit FakeClock(int64_t start_ms = 1'700'000'000'000) : now_ms_(start_ms) {
  }

  util::NowFn Fn() {
    return [this] { return util::FromUnixMillis(now_ms_.load()); };
  }

  void Advance(std::chrono::milliseconds d) {
    now_ms_ += d.count();
  }

  int64_t NowMs() const {
    return now_ms_.load();
  }

 private:
  std::atomic<int64_t> now_ms_;
};

} // namespace fleetq::testing
