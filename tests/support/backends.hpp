#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"

namespace fleetq::testing {

struct Backend {
  std::string                                       name;
  std::function<std::shared_ptr<db::Repository>()> make;
};

inline std::filesystem::path FreshSqlitePath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fleetq_tests";
  std::filesystem::create_directories(dir);

  const auto path = dir / (name + ".sqlite");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

// Backends available without external services. Each make() call returns
// an empty store.
inline std::vector<Backend> LocalBackends(const std::string& test_name) {
  std::vector<Backend> backends;

  backends.push_back({"memory", [] {
                        fleetq::runtime::config::RuntimeConfig config;
                        return factory::BuildRepository(config);
                      }});

#if FLEETQ_DB_SQLITE
  backends.push_back({"sqlite", [test_name] {
                        static int                             generation = 0;
                        fleetq::runtime::config::RuntimeConfig config;
                        config.mutable_database()->mutable_sqlite()->set_path(
                            FreshSqlitePath(test_name + "_" + std::to_string(++generation)).string());
                        return factory::BuildRepository(config);
                      }});
#endif

  return backends;
}

} // namespace fleetq::testing
