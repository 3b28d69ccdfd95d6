#pragma once

#include <cstdint>
#include <iosfwd>

namespace fleetq::queue {
class TaskQueue;
}

namespace fleetq::proxy {
class ProxyPool;
}

namespace fleetq::loader {

enum class LoadMode {
  kAppend,    // existing rows are never touched
  kOverwrite, // every existing row is dropped, in the same transaction
};

struct LoadStats {
  uint64_t inserted   = 0;
  uint64_t duplicates = 0;
  uint64_t invalid    = 0;
  uint64_t removed    = 0;
};

/*
  Line-oriented bulk loaders.

  Blank lines are skipped. Malformed lines are logged with their line number
  and counted; loading carries on. An overwrite whose input has no valid
  line leaves the store as it was.
*/

// One decimal item id per line.
LoadStats LoadTasks(std::istream& in, queue::TaskQueue& queue, uint32_t max_attempts,
                    LoadMode mode = LoadMode::kAppend);

// One host:port:user:pass per line.
LoadStats LoadProxies(std::istream& in, proxy::ProxyPool& pool, LoadMode mode = LoadMode::kAppend);

} // namespace fleetq::loader
