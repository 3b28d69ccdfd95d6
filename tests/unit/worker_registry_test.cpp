#include "internal/worker/worker_registry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/util/errors.hpp"
#include "internal/worker/heartbeat_ticker.hpp"
#include "support/backends.hpp"
#include "support/fake_clock.hpp"

namespace {

using namespace std::chrono_literals;
using fleetq::model::WorkerStatus;
using fleetq::testing::Backend;
using fleetq::testing::FakeClock;
using fleetq::worker::HeartbeatTicker;
using fleetq::worker::WorkerRegistry;

void TestRegisterAndCounters(const Backend& backend) {
  FakeClock      clock;
  WorkerRegistry registry(backend.make(), clock.Fn());

  registry.Register("fleetq_worker:h:1:ab:0");
  auto w = registry.Get("fleetq_worker:h:1:ab:0");
  assert(w);
  assert(w->status == WorkerStatus::kActive);
  assert(w->started_at_ms == clock.NowMs());
  assert(w->last_heartbeat_ms == clock.NowMs());
  assert(w->tasks_processed == 0 && w->tasks_failed == 0);

  registry.RecordOutcome("fleetq_worker:h:1:ab:0", true);
  registry.RecordOutcome("fleetq_worker:h:1:ab:0", true);
  registry.RecordOutcome("fleetq_worker:h:1:ab:0", false);
  w = registry.Get("fleetq_worker:h:1:ab:0");
  assert(w->tasks_processed == 2);
  assert(w->tasks_failed == 1);

  assert(!registry.Get("nobody"));
}

void TestHeartbeatNeverMovesBack(const Backend& backend) {
  FakeClock      clock;
  WorkerRegistry registry(backend.make(), clock.Fn());
  registry.Register("w");

  clock.Advance(30s);
  registry.Heartbeat("w");
  const int64_t latest = clock.NowMs();
  assert(registry.Get("w")->last_heartbeat_ms == latest);

  // a late commit carrying an older timestamp
  clock.Advance(-10s);
  registry.Heartbeat("w");
  assert(registry.Get("w")->last_heartbeat_ms == latest);

  bool threw = false;
  try {
    registry.Heartbeat("ghost");
  } catch (const fleetq::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestStopAndReactivate(const Backend& backend) {
  FakeClock      clock;
  WorkerRegistry registry(backend.make(), clock.Fn());
  registry.Register("w");
  const int64_t started = clock.NowMs();

  registry.MarkStopped("w");
  assert(registry.Get("w")->status == WorkerStatus::kStopped);

  clock.Advance(1min);
  registry.Register("w");
  auto w = registry.Get("w");
  assert(w->status == WorkerStatus::kActive);
  assert(w->started_at_ms == started);
  assert(w->last_heartbeat_ms == clock.NowMs());
}

void TestTickerRefreshesEveryLane(const Backend& backend) {
  FakeClock clock;
  auto      registry = std::make_shared<WorkerRegistry>(backend.make(), clock.Fn());
  registry->Register("lane:0");
  registry->Register("lane:1");

  HeartbeatTicker ticker(registry, {"lane:0", "lane:1", "lane:unregistered"}, 10ms);

  // unknown ids are logged and skipped
  clock.Advance(5s);
  assert(ticker.TickOnce() == 2);
  assert(registry->Get("lane:1")->last_heartbeat_ms == clock.NowMs());

  clock.Advance(5s);
  const int64_t target = clock.NowMs();
  ticker.Start();
  for (int i = 0; i < 200 && registry->Get("lane:0")->last_heartbeat_ms != target; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ticker.Stop();

  assert(registry->Get("lane:0")->last_heartbeat_ms == target);
  assert(registry->Get("lane:1")->last_heartbeat_ms == target);
}

void TestHeartbeatReactivatesStoppedWorker(const Backend& backend) {
  FakeClock      clock;
  WorkerRegistry registry(backend.make(), clock.Fn());
  registry.Register("w1");
  const int64_t started = clock.NowMs();

  registry.MarkStopped("w1");
  clock.Advance(30s);
  registry.Heartbeat("w1");

  auto w = registry.Get("w1");
  assert(w->status == WorkerStatus::kActive);
  assert(w->started_at_ms == started);
  assert(w->last_heartbeat_ms == clock.NowMs());
}

void TestRetiredLaneIsNotRefreshed(const Backend& backend) {
  FakeClock clock;
  auto      registry = std::make_shared<WorkerRegistry>(backend.make(), clock.Fn());
  registry->Register("lane:0");
  registry->Register("lane:1");
  const int64_t registered = clock.NowMs();

  HeartbeatTicker ticker(registry, {"lane:0", "lane:1"}, 10ms);
  ticker.Retire("lane:1");
  registry->MarkStopped("lane:1");

  clock.Advance(5s);
  assert(ticker.TickOnce() == 1);
  assert(registry->Get("lane:0")->last_heartbeat_ms == clock.NowMs());

  auto exited = registry->Get("lane:1");
  assert(exited->status == WorkerStatus::kStopped);
  assert(exited->last_heartbeat_ms == registered);

  ticker.Retire("lane:1");
  ticker.Retire("lane:0");
  assert(ticker.TickOnce() == 0);
}

void TestTickerRestartsAfterStop(const Backend& backend) {
  FakeClock clock;
  auto      registry = std::make_shared<WorkerRegistry>(backend.make(), clock.Fn());
  registry->Register("lane:0");

  HeartbeatTicker ticker(registry, {"lane:0"}, 10ms);
  ticker.Start();
  ticker.Stop();

  clock.Advance(5s);
  const int64_t target = clock.NowMs();
  ticker.Start();
  for (int i = 0; i < 200 && registry->Get("lane:0")->last_heartbeat_ms != target; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ticker.Stop();

  assert(registry->Get("lane:0")->last_heartbeat_ms == target);
}

} // namespace

int main() {
  for (const auto& backend : fleetq::testing::LocalBackends("worker_registry")) {
    TestRegisterAndCounters(backend);
    TestHeartbeatNeverMovesBack(backend);
    TestStopAndReactivate(backend);
    TestTickerRefreshesEveryLane(backend);
    TestHeartbeatReactivatesStoppedWorker(backend);
    TestRetiredLaneIsNotRefreshed(backend);
    TestTickerRestartsAfterStop(backend);
    std::cout << "  " << backend.name << " ok" << std::endl;
  }

  std::cout << "worker_registry_test: pass" << std::endl;
  return 0;
}
