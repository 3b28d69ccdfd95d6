#include "internal/runtime/fleet.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/processing/session.hpp"
#include "internal/proxy/proxy_pool.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/results/result_store.hpp"
#include "internal/worker/worker_registry.hpp"
#include "support/backends.hpp"
#include "support/fake_clock.hpp"

namespace {

using namespace std::chrono_literals;
using fleetq::model::ProxyStatus;
using fleetq::model::TaskStatus;
using fleetq::model::WorkerStatus;
using fleetq::outcome::Classification;
using fleetq::outcome::ProcessingOutcome;
using fleetq::runtime::Fleet;
using fleetq::runtime::FleetOptions;
using fleetq::testing::Backend;
using fleetq::testing::FakeClock;

// Every listing is found on the first try.
class FoundEverywhere : public fleetq::processing::SessionFactory {
 public:
  std::unique_ptr<fleetq::processing::ProcessingSession> Open(const fleetq::proxy::ProxyEndpoint&) override {
    return std::make_unique<Session>();
  }

 private:
  class Session : public fleetq::processing::ProcessingSession {
   public:
    ProcessingOutcome Process(int64_t item_id) override {
      ProcessingOutcome o;
      o.classification = Classification::kContentFound;
      o.record.emplace();
      o.record->title = "listing " + std::to_string(item_id);
      return o;
    }
  };
};

// Holds its one listing until an idle lane has exited, then watches that
// lane's registry row across several heartbeat ticks.
class WatchesIdleLane : public fleetq::processing::SessionFactory {
 public:
  explicit WatchesIdleLane(std::shared_ptr<fleetq::worker::WorkerRegistry> registry) : registry_(std::move(registry)) {
  }

  std::unique_ptr<fleetq::processing::ProcessingSession> Open(const fleetq::proxy::ProxyEndpoint&) override {
    return std::make_unique<Session>(*this);
  }

  // Set before the fleet runs.
  std::vector<std::string> lanes;
  int                      stopped_after_ticks = -1;

 private:
  int CountStopped() {
    int stopped = 0;
    for (const auto& id : lanes) {
      auto w = registry_->Get(id);
      if (w && w->status == WorkerStatus::kStopped) ++stopped;
    }
    return stopped;
  }

  class Session : public fleetq::processing::ProcessingSession {
   public:
    explicit Session(WatchesIdleLane& owner) : owner_(owner) {
    }

    ProcessingOutcome Process(int64_t) override {
      for (int i = 0; i < 200 && owner_.CountStopped() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
      }
      std::this_thread::sleep_for(60ms);
      owner_.stopped_after_ticks = owner_.CountStopped();

      ProcessingOutcome o;
      o.classification = Classification::kContentRemoved;
      return o;
    }

   private:
    WatchesIdleLane& owner_;
  };

  std::shared_ptr<fleetq::worker::WorkerRegistry> registry_;
};

// Throws something that is not a std::exception out of Process.
class ThrowsNonStandard : public fleetq::processing::SessionFactory {
 public:
  std::unique_ptr<fleetq::processing::ProcessingSession> Open(const fleetq::proxy::ProxyEndpoint&) override {
    return std::make_unique<Session>();
  }

 private:
  class Session : public fleetq::processing::ProcessingSession {
   public:
    ProcessingOutcome Process(int64_t) override {
      throw 42;
    }
  };
};

struct Setup {
  explicit Setup(const Backend& backend) : repo(backend.make()) {
    services.tasks    = std::make_shared<fleetq::queue::TaskQueue>(repo, clock.Fn());
    services.proxies  = std::make_shared<fleetq::proxy::ProxyPool>(repo, clock.Fn());
    services.registry = std::make_shared<fleetq::worker::WorkerRegistry>(repo, clock.Fn());
    services.results  = std::make_shared<fleetq::results::ResultStore>(repo, clock.Fn());
    services.sessions = std::make_shared<FoundEverywhere>();
    services.now      = clock.Fn();

    options.program_id                   = "fleet_test";
    options.lanes                        = 3;
    options.heartbeat_interval           = 10ms;
    options.lane.no_proxy_backoff        = 5ms;
    options.lane.store_retry_attempts    = 3;
    options.lane.store_retry_delay       = 5ms;
  }

  FakeClock                            clock;
  std::shared_ptr<fleetq::db::Repository> repo;
  fleetq::worker::LaneServices         services;
  FleetOptions                         options;
};

void TestLanesDrainQueue(const Backend& backend) {
  Setup s(backend);
  for (int64_t item = 1; item <= 20; ++item) {
    assert(s.services.tasks->Enqueue(item, 3));
  }
  // fewer proxies than lanes: someone always waits
  assert(s.services.proxies->Add("10.0.0.1:8080:u:p"));
  assert(s.services.proxies->Add("10.0.0.2:8080:u:p"));

  fleetq::reaper::ReaperOptions reaper;
  reaper.interval        = 10ms;
  s.options.embedded_reaper = reaper;

  Fleet fleet(s.repo, s.services, s.options);
  assert(fleet.WorkerIds().size() == 3);
  for (const auto& id : fleet.WorkerIds()) {
    assert(id.rfind("fleet_test:", 0) == 0);
  }

  auto total = fleet.Run();
  assert(total.attempts == 20);
  assert(total.completed == 20);
  assert(total.failed_attempts == 0);
  assert(total.store_errors == 0);

  for (int64_t item = 1; item <= 20; ++item) {
    assert(s.services.tasks->FindByItem(item)->status == TaskStatus::kCompleted);
    assert(s.services.results->Get(item)->title == "listing " + std::to_string(item));
  }

  auto p1 = s.services.proxies->Get(1);
  auto p2 = s.services.proxies->Get(2);
  assert(p1->status == ProxyStatus::kAvailable && p2->status == ProxyStatus::kAvailable);
  assert(p1->uses_count + p2->uses_count == 20);

  uint64_t processed = 0;
  for (const auto& id : fleet.WorkerIds()) {
    auto w = s.services.registry->Get(id);
    assert(w && w->status == WorkerStatus::kStopped);
    processed += w->tasks_processed;
  }
  assert(processed == 20);
}

void TestStopWhileStarvedOfProxies(const Backend& backend) {
  Setup s(backend);
  for (int64_t item = 1; item <= 5; ++item) {
    assert(s.services.tasks->Enqueue(item, 3));
  }

  Fleet       fleet(s.repo, s.services, s.options);
  std::thread stopper([&fleet] {
    std::this_thread::sleep_for(80ms);
    fleet.Stop();
  });
  auto total = fleet.Run();
  stopper.join();

  assert(fleet.Stopped());
  assert(total.attempts == 0);
  assert(total.requeued == 3);
  assert(total.proxy_waits >= 3);

  for (int64_t item = 1; item <= 5; ++item) {
    auto task = s.services.tasks->FindByItem(item);
    assert(task->status == TaskStatus::kPending);
    assert(task->attempts == 0);
  }
}

void TestExitedLaneStaysStopped(const Backend& backend) {
  Setup s(backend);
  assert(s.services.tasks->Enqueue(1, 3));
  assert(s.services.proxies->Add("10.0.0.1:8080:u:p"));
  s.options.lanes = 2;

  auto watcher        = std::make_shared<WatchesIdleLane>(s.services.registry);
  s.services.sessions = watcher;

  Fleet fleet(s.repo, s.services, s.options);
  watcher->lanes = fleet.WorkerIds();

  auto total = fleet.Run();
  assert(total.completed == 1);

  // the lane that found no work was not revived by the heartbeat ticker
  assert(watcher->stopped_after_ticks == 1);
  for (const auto& id : fleet.WorkerIds()) {
    assert(s.services.registry->Get(id)->status == WorkerStatus::kStopped);
  }
}

void TestNonStandardLaneFailureSurfaces(const Backend& backend) {
  Setup s(backend);
  assert(s.services.tasks->Enqueue(1, 3));
  assert(s.services.proxies->Add("10.0.0.1:8080:u:p"));
  s.options.lanes     = 1;
  s.services.sessions = std::make_shared<ThrowsNonStandard>();

  Fleet fleet(s.repo, s.services, s.options);
  bool  thrown = false;
  try {
    fleet.Run();
  } catch (int code) {
    thrown = code == 42;
  }
  assert(thrown);

  // the lease went back on unwind; the task waits for the reaper
  assert(s.services.proxies->Get(1)->status == ProxyStatus::kAvailable);
  auto task = s.services.tasks->FindByItem(1);
  assert(task->status == TaskStatus::kProcessing);
  assert(task->worker_id == fleet.WorkerIds().front());
}

} // namespace

int main() {
  for (const auto& backend : fleetq::testing::LocalBackends("fleet")) {
    TestLanesDrainQueue(backend);
    TestStopWhileStarvedOfProxies(backend);
    TestExitedLaneStaysStopped(backend);
    TestNonStandardLaneFailureSurfaces(backend);
    std::cout << "  " << backend.name << " ok" << std::endl;
  }

  std::cout << "fleet_test: pass" << std::endl;
  return 0;
}
