#include "fleet.hpp"

#include <exception>
#include <mutex>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/worker/heartbeat_ticker.hpp"
#include "internal/worker/worker_id.hpp"

namespace fleetq::runtime {

using observability::IntField;
using observability::StringField;

Fleet::Fleet(std::shared_ptr<db::Repository> repository, worker::LaneServices services, FleetOptions options)
    : repository_(std::move(repository)), services_(std::move(services)), options_(std::move(options)) {
  if (options_.lanes == 0) options_.lanes = 1;

  const auto identity = worker::CurrentProcessIdentity(options_.program_id);
  worker_ids_.reserve(options_.lanes);
  for (uint32_t lane = 0; lane < options_.lanes; ++lane) {
    worker_ids_.push_back(worker::MakeWorkerId(identity, lane));
  }
}

worker::LaneStats Fleet::Run() {
  FLEETQ_LOG_INFO("fleet starting", {StringField("program_id", options_.program_id),
                                     IntField("lanes", options_.lanes),
                                     IntField("heartbeat_ms", options_.heartbeat_interval.count())});

  worker::HeartbeatTicker ticker(services_.registry, worker_ids_, options_.heartbeat_interval);
  ticker.Start();

  std::unique_ptr<reaper::Reaper> reaper;
  if (options_.embedded_reaper) {
    reaper = std::make_unique<reaper::Reaper>(repository_, services_.now, *options_.embedded_reaper);
    reaper->Start();
  }

  worker::LaneServices lane_services = services_;
  lane_services.retire                = [&ticker](const std::string& id) { ticker.Retire(id); };

  std::mutex               stats_mutex;
  worker::LaneStats        total;
  std::exception_ptr       lane_failure;
  std::vector<std::thread> lanes;
  lanes.reserve(worker_ids_.size());

  for (const auto& id : worker_ids_) {
    lanes.emplace_back([this, &id, &ticker, &lane_services, &stats_mutex, &total, &lane_failure] {
      try {
        worker::WorkerLoop loop(id, lane_services, options_.lane, stop_);
        auto               stats = loop.Run();

        std::lock_guard lock(stats_mutex);
        total += stats;
      } catch (const std::exception& e) {
        // the reaper will return anything this lane still held
        FLEETQ_LOG_ERROR("lane terminated", {StringField("worker_id", id), StringField("error", e.what())});
      } catch (...) {
        FLEETQ_LOG_ERROR("lane terminated", {StringField("worker_id", id), StringField("error", "non-standard exception")});
        std::lock_guard lock(stats_mutex);
        if (!lane_failure) lane_failure = std::current_exception();
      }
      ticker.Retire(id);
    });
  }

  for (auto& t : lanes) t.join();

  ticker.Stop();
  if (reaper) reaper->Stop();

  FLEETQ_LOG_INFO("fleet stopped", {IntField("attempts", static_cast<int64_t>(total.attempts)),
                                    IntField("completed", static_cast<int64_t>(total.completed)),
                                    IntField("tasks_failed", static_cast<int64_t>(total.tasks_failed)),
                                    IntField("requeued", static_cast<int64_t>(total.requeued))});

  if (lane_failure) std::rethrow_exception(lane_failure);
  return total;
}

void Fleet::Stop() {
  stop_.Trigger();
}

} // namespace fleetq::runtime
