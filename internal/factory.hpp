#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/proxy/proxy_pool.hpp"
#include "internal/queue/task_queue.hpp"
#include "internal/reaper/reaper.hpp"
#include "internal/results/result_store.hpp"
#include "internal/runtime/fleet.hpp"
#include "internal/service/status_service.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/worker_registry.hpp"

namespace fleetq::processing {
class SessionFactory;
}

namespace fleetq::factory {

/*
  Application

  Owns the long-lived components of one process. Every executable builds
  one of these and uses the parts it needs.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<queue::TaskQueue>         tasks;
  std::shared_ptr<proxy::ProxyPool>         proxies;
  std::shared_ptr<worker::WorkerRegistry>   registry;
  std::shared_ptr<results::ResultStore>     results;
  std::shared_ptr<service::StatusService>   status;
};

/*
  BuildRepository

  Opens the configured backend and bootstraps its schema.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const fleetq::runtime::config::RuntimeConfig& config);

Application Build(const fleetq::runtime::config::RuntimeConfig& config, util::NowFn now = util::Now);

reaper::ReaperOptions ReaperOptionsFrom(const fleetq::runtime::config::RuntimeConfig& config);

runtime::FleetOptions FleetOptionsFrom(const fleetq::runtime::config::RuntimeConfig& config);

// Session factory for the configured processor command.
std::shared_ptr<processing::SessionFactory> BuildSessionFactory(const fleetq::runtime::config::RuntimeConfig& config);

worker::LaneServices LaneServicesFor(const Application& app, std::shared_ptr<processing::SessionFactory> sessions,
                                     util::NowFn now = util::Now);

} // namespace fleetq::factory
