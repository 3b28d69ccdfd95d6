#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/fleet.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: fleetq-worker <config.yaml> OR fleetq-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fleetq::config::ConfigLoader::LoadFromYaml(config_path);

    fleetq::observability::InitializeLogging(config, "fleetq-worker");

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app      = fleetq::factory::Build(config);
    auto sessions = fleetq::factory::BuildSessionFactory(config);

    fleetq::runtime::Fleet fleet(app.repository, fleetq::factory::LaneServicesFor(app, sessions),
                                 fleetq::factory::FleetOptionsFrom(config));

    // Register signal handlers before the lanes start to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> finished{false};
    std::thread       watcher([&] {
      while (g_running && !finished) std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (!g_running) {
        FLEETQ_LOG_INFO("Shutdown requested, finishing current attempts");
        fleet.Stop();
      }
    });

    try {
      fleet.Run();
    } catch (const std::exception&) {
      finished = true;
      watcher.join();
      throw;
    }
    finished = true;
    watcher.join();

    FLEETQ_LOG_INFO("Worker exited");
    fleetq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FLEETQ_LOG_ERROR("Fatal error", {fleetq::observability::StringField("error", e.what())});
    fleetq::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
