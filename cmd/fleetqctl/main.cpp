#include <fstream>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/factory.hpp"
#include "internal/loader/loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/status_service.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  fleetqctl <config.yaml> status\n"
            << "  fleetqctl <config.yaml> init-db\n"
            << "  fleetqctl <config.yaml> load-tasks <file> [--overwrite]\n"
            << "  fleetqctl <config.yaml> load-proxies <file> [--overwrite]\n"
            << "\n"
            << "  --overwrite  drop every existing row before loading\n";
}

static void PrintLoadStats(const char* kind, const fleetq::loader::LoadStats& stats) {
  std::cout << kind << " removed=" << stats.removed << " inserted=" << stats.inserted << " duplicates=" << stats.duplicates
            << " invalid=" << stats.invalid << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  const bool needs_file = cmd == "load-tasks" || cmd == "load-proxies";
  const bool overwrite  = needs_file && argc == 5 && std::string(argv[4]) == "--overwrite";
  if ((needs_file && argc != 4 && !overwrite) || (!needs_file && argc != 3) ||
      (!needs_file && cmd != "status" && cmd != "init-db")) {
    Usage();
    return 1;
  }
  const auto mode = overwrite ? fleetq::loader::LoadMode::kOverwrite : fleetq::loader::LoadMode::kAppend;

  try {
    auto config = fleetq::config::ConfigLoader::LoadFromYaml(config_path);

    fleetq::observability::InitializeLogging(config, "fleetqctl");

    auto app = fleetq::factory::Build(config);

    if (cmd == "init-db") {
      std::cout << "schema version " << fleetq::db::sql::kSchemaVersion << " ready\n";
    } else if (cmd == "status") {
      fleetq::service::PrintStatus(std::cout, app.status->Snapshot());
    } else {
      std::ifstream in(argv[3]);
      if (!in) {
        std::cerr << "cannot open " << argv[3] << "\n";
        fleetq::observability::ShutdownLogging();
        return 1;
      }

      if (cmd == "load-tasks") {
        PrintLoadStats("tasks", fleetq::loader::LoadTasks(in, *app.tasks, config.queue().max_task_attempts(), mode));
      } else {
        PrintLoadStats("proxies", fleetq::loader::LoadProxies(in, *app.proxies, mode));
      }
    }

    fleetq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FLEETQ_LOG_ERROR("Fatal error", {fleetq::observability::StringField("error", e.what())});
    fleetq::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
