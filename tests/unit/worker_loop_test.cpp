#include "internal/worker/worker_loop.hpp"

#include <cassert>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/processing/session.hpp"
#include "internal/proxy/proxy_pool.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/results/result_store.hpp"
#include "internal/util/stop_signal.hpp"
#include "internal/worker/worker_registry.hpp"
#include "support/backends.hpp"
#include "support/fake_clock.hpp"
#include "support/intercepting_repository.hpp"

namespace {

using namespace std::chrono_literals;
using fleetq::model::ProxyStatus;
using fleetq::model::ResultStatus;
using fleetq::model::TaskStatus;
using fleetq::model::WorkerStatus;
using fleetq::outcome::Classification;
using fleetq::outcome::ProcessingOutcome;
using fleetq::testing::Backend;
using fleetq::testing::FakeClock;
using fleetq::testing::InterceptingRepository;
using fleetq::util::StopSignal;
using fleetq::worker::LaneOptions;
using fleetq::worker::LaneServices;
using fleetq::worker::WorkerLoop;

constexpr const char* kP1 = "10.0.0.1:8080:u1:p1";
constexpr const char* kP2 = "10.0.0.2:8080:u2:p2";

using Step = std::function<ProcessingOutcome(int64_t item_id)>;

// Outcomes handed out in order, whichever session asks.
class ScriptedFactory : public fleetq::processing::SessionFactory {
 public:
  void Push(Step step) {
    std::lock_guard lock(mu_);
    steps_.push_back(std::move(step));
  }

  std::unique_ptr<fleetq::processing::ProcessingSession> Open(const fleetq::proxy::ProxyEndpoint& endpoint) override {
    std::lock_guard lock(mu_);
    opened_.push_back(endpoint.server);
    return std::make_unique<Session>(*this);
  }

  std::vector<std::string> Opened() {
    std::lock_guard lock(mu_);
    return opened_;
  }

  std::vector<int64_t> Processed() {
    std::lock_guard lock(mu_);
    return processed_;
  }

 private:
  class Session : public fleetq::processing::ProcessingSession {
   public:
    explicit Session(ScriptedFactory& factory) : factory_(factory) {}

    ProcessingOutcome Process(int64_t item_id) override {
      return factory_.Next(item_id)(item_id);
    }

   private:
    ScriptedFactory& factory_;
  };

  Step Next(int64_t item_id) {
    std::lock_guard lock(mu_);
    processed_.push_back(item_id);
    if (steps_.empty()) throw std::logic_error("script exhausted");
    Step step = std::move(steps_.front());
    steps_.pop_front();
    return step;
  }

  std::mutex               mu_;
  std::deque<Step>         steps_;
  std::vector<std::string> opened_;
  std::vector<int64_t>     processed_;
};

Step Returns(Classification c) {
  return [c](int64_t) {
    ProcessingOutcome o;
    o.classification = c;
    return o;
  };
}

Step Found(const std::string& title) {
  return [title](int64_t) {
    ProcessingOutcome o;
    o.classification = Classification::kContentFound;
    o.record.emplace();
    o.record->title = title;
    o.record->price = 1200.0;
    return o;
  };
}

struct Harness {
  explicit Harness(const Backend& backend) {
    store              = std::make_shared<InterceptingRepository>(backend.make());
    auto repo          = store;
    services.tasks     = std::make_shared<fleetq::queue::TaskQueue>(repo, clock.Fn());
    services.proxies   = std::make_shared<fleetq::proxy::ProxyPool>(repo, clock.Fn(), 3);
    services.registry  = std::make_shared<fleetq::worker::WorkerRegistry>(repo, clock.Fn());
    services.results   = std::make_shared<fleetq::results::ResultStore>(repo, clock.Fn());
    services.sessions  = factory;
    services.now       = clock.Fn();
    options.no_proxy_backoff     = 10ms;
    options.store_retry_attempts = 2;
    options.store_retry_delay    = 10ms;
  }

  fleetq::worker::LaneStats RunLane(const std::string& worker_id, StopSignal& stop) {
    WorkerLoop lane(worker_id, services, options, stop);
    return lane.Run();
  }

  FakeClock                               clock;
  std::shared_ptr<InterceptingRepository> store;
  std::shared_ptr<ScriptedFactory>        factory = std::make_shared<ScriptedFactory>();
  LaneServices                     services;
  LaneOptions                      options;
};

// One listing, two lanes: the first fails extraction and shuts down, the
// second picks the task up on the same proxy and finishes it.
void TestFailedAttemptThenSuccessOnAnotherLane(const Backend& backend) {
  Harness h(backend);
  assert(h.services.tasks->Enqueue(42, 2));
  assert(h.services.proxies->Add(kP1));

  StopSignal stop_a;
  h.factory->Push([&stop_a](int64_t item_id) {
    stop_a.Trigger();
    return Returns(Classification::kExtractionFailed)(item_id);
  });

  auto stats_a = h.RunLane("fleetq_worker:h:1:aa:0", stop_a);
  assert(stats_a.attempts == 1);
  assert(stats_a.failed_attempts == 1);
  assert(stats_a.completed == 0);

  auto task = h.services.tasks->FindByItem(42);
  assert(task->status == TaskStatus::kPending);
  assert(task->attempts == 1);
  assert(task->worker_id.empty());

  auto p1 = h.services.proxies->Get(1);
  assert(p1->status == ProxyStatus::kAvailable);
  assert(p1->uses_count == 1);

  auto worker_a = h.services.registry->Get("fleetq_worker:h:1:aa:0");
  assert(worker_a->status == WorkerStatus::kStopped);
  assert(worker_a->tasks_failed == 1);
  assert(worker_a->tasks_processed == 0);
  assert(!h.services.results->Get(42));

  h.clock.Advance(5s);
  h.factory->Push(Found("Road bike"));

  StopSignal stop_b;
  auto       stats_b = h.RunLane("fleetq_worker:h:1:aa:1", stop_b);
  assert(stats_b.attempts == 1);
  assert(stats_b.completed == 1);
  assert(stats_b.store_errors == 0);

  auto result = h.services.results->Get(42);
  assert(result);
  assert(result->status == ResultStatus::kSuccess);
  assert(result->title == "Road bike");
  assert(result->price && *result->price == 1200.0);
  assert(result->attempts == 2);
  assert(result->worker_id == "fleetq_worker:h:1:aa:1");
  assert(result->processed_at_ms == h.clock.NowMs());

  task = h.services.tasks->FindByItem(42);
  assert(task->status == TaskStatus::kCompleted);
  assert(task->attempts == 1);
  assert(task->completed_at_ms == h.clock.NowMs());

  p1 = h.services.proxies->Get(1);
  assert(p1->status == ProxyStatus::kAvailable);
  assert(p1->uses_count == 2);

  auto worker_b = h.services.registry->Get("fleetq_worker:h:1:aa:1");
  assert(worker_b->status == WorkerStatus::kStopped);
  assert(worker_b->tasks_processed == 1);

  assert(h.factory->Opened().size() == 2);
}

void TestBlockedProxyRotatesSession(const Backend& backend) {
  Harness h(backend);
  assert(h.services.tasks->Enqueue(7, 3));
  assert(h.services.proxies->Add(kP1));
  assert(h.services.proxies->Add(kP2));

  h.factory->Push(Returns(Classification::kBlockedHard));
  h.factory->Push(Found("Desk"));

  StopSignal stop;
  auto       stats = h.RunLane("w-rotate", stop);
  assert(stats.attempts == 2);
  assert(stats.rotations == 1);
  assert(stats.failed_attempts == 1);
  assert(stats.completed == 1);

  const auto opened = h.factory->Opened();
  assert(opened.size() == 2);
  assert(opened[0] == "http://10.0.0.1:8080");
  assert(opened[1] == "http://10.0.0.2:8080");

  auto p1 = h.services.proxies->Get(1);
  assert(p1->blocks_count == 1);
  assert(p1->status == ProxyStatus::kAvailable);
  assert(p1->locked_by.empty());

  auto task = h.services.tasks->FindByItem(7);
  assert(task->status == TaskStatus::kCompleted);
  assert(h.services.results->Get(7)->attempts == 2);
}

// The other proxy has seen more use; the flagged one must still lose.
void TestRotationSkipsFlaggedProxy(const Backend& backend) {
  Harness h(backend);
  assert(h.services.tasks->Enqueue(8, 3));
  assert(h.services.proxies->Add(kP1));
  assert(h.services.proxies->Add(kP2));
  for (int i = 0; i < 3; ++i) {
    assert(h.services.proxies->ClaimPreferred(2, "warmup"));
    assert(h.services.proxies->Release(2, "warmup"));
  }
  assert(h.services.proxies->Get(2)->uses_count == 3);

  h.factory->Push(Returns(Classification::kBlockedHard));
  h.factory->Push(Found("Chair"));

  StopSignal stop;
  auto       stats = h.RunLane("w-fresh", stop);
  assert(stats.rotations == 1);
  assert(stats.completed == 1);

  const auto opened = h.factory->Opened();
  assert(opened.size() == 2);
  assert(opened[0] == "http://10.0.0.1:8080");
  assert(opened[1] == "http://10.0.0.2:8080");

  assert(h.services.proxies->Get(1)->blocks_count == 1);
  assert(h.services.proxies->Get(1)->uses_count == 1);
  assert(h.services.proxies->Get(2)->uses_count == 4);
}

void TestProxyFreedBeforeOutcomeIsRecorded(const Backend& backend) {
  Harness h(backend);
  assert(h.services.tasks->Enqueue(21, 3));
  assert(h.services.proxies->Add(kP1));

  std::vector<ProxyStatus> seen;
  h.store->OnUpsertResult([&seen](fleetq::db::Repository& inner, fleetq::db::Transaction& tx) {
    seen.push_back(inner.GetProxy(tx, 1)->status);
    return fleetq::db::Result::Ok();
  });
  h.factory->Push(Found("Sofa"));

  StopSignal stop;
  auto       stats = h.RunLane("w-order", stop);
  assert(stats.completed == 1);
  assert((seen == std::vector<ProxyStatus>{ProxyStatus::kAvailable}));
}

void TestFailingStoreDoesNotHoldProxy(const Backend& backend) {
  Harness h(backend);
  assert(h.services.tasks->Enqueue(22, 3));
  assert(h.services.proxies->Add(kP1));

  std::vector<ProxyStatus> seen;
  h.store->OnUpsertResult([&seen](fleetq::db::Repository& inner, fleetq::db::Transaction& tx) {
    seen.push_back(inner.GetProxy(tx, 1)->status);
    return fleetq::db::Result::Err(fleetq::db::ErrorCode::IOError, "disk full");
  });
  h.factory->Push(Found("Table"));

  StopSignal stop;
  auto       stats = h.RunLane("w-store-down", stop);
  assert(stats.attempts == 1);
  assert(stats.completed == 0);
  assert(stats.store_errors == 1);

  // every retry ran with the proxy already back in the pool
  assert(seen.size() == h.options.store_retry_attempts);
  for (auto status : seen) assert(status == ProxyStatus::kAvailable);

  auto p1 = h.services.proxies->Get(1);
  assert(p1->status == ProxyStatus::kAvailable);
  assert(p1->locked_by.empty());

  // left for the reaper, the result was never written
  auto task = h.services.tasks->FindByItem(22);
  assert(task->status == TaskStatus::kProcessing);
  assert(task->worker_id == "w-store-down");
  assert(!h.services.results->Get(22));
}

void TestSessionKeptAcrossTasks(const Backend& backend) {
  Harness h(backend);
  assert(h.services.tasks->Enqueue(1, 3));
  h.clock.Advance(1ms);
  assert(h.services.tasks->Enqueue(2, 3));
  assert(h.services.proxies->Add(kP1));
  assert(h.services.proxies->Add(kP2));

  h.factory->Push(Returns(Classification::kContentRemoved));
  h.factory->Push(Found("Lamp"));

  StopSignal stop;
  auto       stats = h.RunLane("w-reuse", stop);
  assert(stats.completed == 2);

  assert(h.factory->Opened().size() == 1);
  assert((h.factory->Processed() == std::vector<int64_t>{1, 2}));

  // reclaimed by id instead of moving to the less used P2
  assert(h.services.proxies->Get(1)->uses_count == 2);
  assert(h.services.proxies->Get(2)->uses_count == 0);

  auto removed = h.services.results->Get(1);
  assert(removed->status == ResultStatus::kUnavailable);
  assert(removed->title.empty());
  assert(h.services.results->Get(2)->status == ResultStatus::kSuccess);
}

void TestSessionExceptionIsAFailedAttempt(const Backend& backend) {
  Harness h(backend);
  assert(h.services.tasks->Enqueue(11, 3));
  assert(h.services.proxies->Add(kP1));

  h.factory->Push([](int64_t) -> ProcessingOutcome { throw std::runtime_error("browser crashed"); });
  h.factory->Push(Returns(Classification::kContentRemoved));

  StopSignal stop;
  auto       stats = h.RunLane("w-crash", stop);
  assert(stats.attempts == 2);
  assert(stats.failed_attempts == 1);
  assert(stats.rotations == 0);
  assert(stats.completed == 1);

  // the crashed session is replaced, the proxy is not blocked
  assert(h.factory->Opened().size() == 2);
  assert(h.services.proxies->Get(1)->blocks_count == 0);

  auto worker = h.services.registry->Get("w-crash");
  assert(worker->tasks_failed == 1);
  assert(worker->tasks_processed == 1);

  auto result = h.services.results->Get(11);
  assert(result->status == ResultStatus::kUnavailable);
  assert(result->attempts == 2);
}

void TestExhaustedTaskFails(const Backend& backend) {
  Harness h(backend);
  assert(h.services.tasks->Enqueue(5, 2));
  assert(h.services.proxies->Add(kP1));

  h.factory->Push(Returns(Classification::kUnexpected));
  h.factory->Push(Returns(Classification::kExtractionFailed));

  StopSignal stop;
  auto       stats = h.RunLane("w-exhaust", stop);
  assert(stats.failed_attempts == 2);
  assert(stats.tasks_failed == 1);
  assert(stats.completed == 0);

  auto task = h.services.tasks->FindByItem(5);
  assert(task->status == TaskStatus::kFailed);
  assert(task->attempts == 2);
  assert(!h.services.results->Get(5));
}

void TestStopWhileWaitingForProxyRequeues(const Backend& backend) {
  Harness h(backend);
  assert(h.services.tasks->Enqueue(9, 3));

  StopSignal  stop;
  std::thread stopper([&stop] {
    std::this_thread::sleep_for(60ms);
    stop.Trigger();
  });
  auto stats = h.RunLane("w-wait", stop);
  stopper.join();

  assert(stats.attempts == 0);
  assert(stats.proxy_waits >= 1);
  assert(stats.requeued == 1);

  auto task = h.services.tasks->FindByItem(9);
  assert(task->status == TaskStatus::kPending);
  assert(task->attempts == 0);
  assert(task->worker_id.empty());
  assert(h.factory->Opened().empty());
}

void TestDrainedQueueStopsLane(const Backend& backend) {
  Harness h(backend);
  assert(h.services.proxies->Add(kP1));

  StopSignal stop;
  auto       stats = h.RunLane("w-idle", stop);
  assert(stats.attempts == 0);
  assert(stats.proxy_waits == 0);

  auto worker = h.services.registry->Get("w-idle");
  assert(worker);
  assert(worker->status == WorkerStatus::kStopped);
  assert(h.services.proxies->Get(1)->uses_count == 0);
}

} // namespace

int main() {
  for (const auto& backend : fleetq::testing::LocalBackends("worker_loop")) {
    TestFailedAttemptThenSuccessOnAnotherLane(backend);
    TestBlockedProxyRotatesSession(backend);
    TestRotationSkipsFlaggedProxy(backend);
    TestProxyFreedBeforeOutcomeIsRecorded(backend);
    TestFailingStoreDoesNotHoldProxy(backend);
    TestSessionKeptAcrossTasks(backend);
    TestSessionExceptionIsAFailedAttempt(backend);
    TestExhaustedTaskFails(backend);
    TestStopWhileWaitingForProxyRequeues(backend);
    TestDrainedQueueStopsLane(backend);
    std::cout << "  " << backend.name << " ok" << std::endl;
  }

  std::cout << "worker_loop_test: pass" << std::endl;
  return 0;
}
