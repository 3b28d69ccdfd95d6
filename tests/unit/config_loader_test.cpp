#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace {

using fleetq::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fleetq_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestDefaultsFillUnsetSections() {
  const auto yaml_path = WriteYaml("defaults", R"(logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(!config.database().has_postgres());
  assert(!config.database().has_sqlite());

  assert(config.worker().program_id() == "fleetq_worker");
  assert(config.worker().lanes() == 15);
  assert(config.worker().heartbeat_interval().seconds() == 30);
  assert(config.worker().no_proxy_backoff().seconds() == 30);
  assert(config.worker().store_retry_attempts() == 5);

  assert(config.queue().max_task_attempts() == 5);
  assert(config.queue().claim_conflict_retries() == 64);
  assert(config.proxies().block_threshold() == 3);

  assert(config.reaper().interval().seconds() == 60);
  assert(config.reaper().stale_task_after().seconds() == 600);
  assert(config.reaper().stale_lock_after().seconds() == 300);
  assert(config.reaper().dead_worker_after().seconds() == 240);
  assert(!config.reaper().embedded());

  assert(config.processor().timeout().seconds() == 120);
}

void TestExplicitValuesAreKept() {
  const auto yaml_path = WriteYaml("explicit", R"(database:
  sqlite:
    path: "/var/lib/fleetq/queue.sqlite"
worker:
  program_id: scraper
  lanes: 4
  heartbeat_interval: "5s"
  no_proxy_backoff: "1.5s"
queue:
  max_task_attempts: 2
proxies:
  block_threshold: 7
reaper:
  interval: "10s"
  stale_task_after: "90s"
  embedded: true
processor:
  command: ["/usr/bin/python3", "extract.py"]
  timeout: "45s"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "/var/lib/fleetq/queue.sqlite");
  assert(config.worker().program_id() == "scraper");
  assert(config.worker().lanes() == 4);
  assert(config.worker().heartbeat_interval().seconds() == 5);
  assert(fleetq::util::FromProto(config.worker().no_proxy_backoff()).count() == 1500);
  assert(config.queue().max_task_attempts() == 2);
  assert(config.proxies().block_threshold() == 7);
  assert(config.reaper().interval().seconds() == 10);
  assert(config.reaper().stale_task_after().seconds() == 90);
  // untouched siblings still get defaults
  assert(config.reaper().stale_lock_after().seconds() == 300);
  assert(config.reaper().embedded());
  assert(config.processor().command_size() == 2);
  assert(config.processor().command(1) == "extract.py");
  assert(config.processor().timeout().seconds() == 45);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(worker:
  lanes: 2
  turbo: true
)");

  assert(Throws([&] { ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestMissingFileIsReported() {
  assert(Throws([] { ConfigLoader::LoadFromYaml("/nonexistent/fleetq/config.yaml"); }));
}

void TestEnvironmentOverrides() {
  const auto yaml_path = WriteYaml("env", R"(worker:
  lanes: 2
)");

  setenv("FLEETQ_WORKER_LANES", "9", 1);
  setenv("FLEETQ_STALE_TASK_SEC", "30", 1);
  setenv("FLEETQ_PROXY_BLOCK_THRESHOLD", "5", 1);
  setenv("FLEETQ_DATABASE_URI", "postgresql://fleetq@localhost/fleetq", 1);

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());

  unsetenv("FLEETQ_WORKER_LANES");
  unsetenv("FLEETQ_STALE_TASK_SEC");
  unsetenv("FLEETQ_PROXY_BLOCK_THRESHOLD");
  unsetenv("FLEETQ_DATABASE_URI");

  assert(config.worker().lanes() == 9);
  assert(config.reaper().stale_task_after().seconds() == 30);
  assert(config.proxies().block_threshold() == 5);
  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "postgresql://fleetq@localhost/fleetq");
  assert(config.database().postgres().max_connections() == 16);
}

void TestInvalidEnvironmentValuesAreRejected() {
  const auto yaml_path = WriteYaml("env_invalid", "worker:\n  lanes: 2\n");

  setenv("FLEETQ_WORKER_LANES", "0", 1);
  assert(Throws([&] { ConfigLoader::LoadFromYaml(yaml_path.string()); }));

  setenv("FLEETQ_WORKER_LANES", "many", 1);
  assert(Throws([&] { ConfigLoader::LoadFromYaml(yaml_path.string()); }));
  unsetenv("FLEETQ_WORKER_LANES");

  setenv("FLEETQ_REAPER_INTERVAL_SEC", "-5", 1);
  assert(Throws([&] { ConfigLoader::LoadFromYaml(yaml_path.string()); }));
  unsetenv("FLEETQ_REAPER_INTERVAL_SEC");
}

void TestOversizedEnvironmentValuesAreRejected() {
  const auto yaml_path = WriteYaml("env_oversized", "worker:\n  lanes: 2\n");

  // 2^32 + 1 would wrap to 1 lane
  setenv("FLEETQ_WORKER_LANES", "4294967297", 1);
  assert(Throws([&] { ConfigLoader::LoadFromYaml(yaml_path.string()); }));

  setenv("FLEETQ_WORKER_LANES", "4294967295", 1);
  assert(ConfigLoader::LoadFromYaml(yaml_path.string()).worker().lanes() == 4294967295u);
  unsetenv("FLEETQ_WORKER_LANES");

  setenv("FLEETQ_STALE_TASK_SEC", "99999999999999999999999", 1);
  assert(Throws([&] { ConfigLoader::LoadFromYaml(yaml_path.string()); }));
  unsetenv("FLEETQ_STALE_TASK_SEC");
}

} // namespace

int main() {
  TestDefaultsFillUnsetSections();
  TestExplicitValuesAreKept();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestEnvironmentOverrides();
  TestInvalidEnvironmentValuesAreRejected();
  TestOversizedEnvironmentValuesAreRejected();

  std::cout << "config_loader_test: pass" << std::endl;
  return 0;
}
