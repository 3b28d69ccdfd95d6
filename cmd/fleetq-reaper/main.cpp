#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reaper/reaper.hpp"

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
    std::cerr << "Usage: fleetq-reaper <config.yaml> OR fleetq-reaper --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = fleetq::config::ConfigLoader::LoadFromYaml(config_path);

    fleetq::observability::InitializeLogging(config, "fleetq-reaper");

    auto repository = fleetq::factory::BuildRepository(config);

    fleetq::reaper::Reaper reaper(repository, fleetq::util::Now, fleetq::factory::ReaperOptionsFrom(config));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    reaper.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLEETQ_LOG_INFO("Shutting down reaper");

    reaper.Stop();
    fleetq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FLEETQ_LOG_ERROR("Fatal error", {fleetq::observability::StringField("error", e.what())});
    fleetq::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
