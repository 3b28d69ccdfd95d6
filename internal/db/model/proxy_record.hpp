#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace fleetq::db::model {

/*
  Persistent proxy row.

  blocks_count only grows; once status=blocked the row never leaves it.
*/

struct ProxyRecord {
  int64_t     id = 0;
  std::string proxy; // host:port:user:pass, unique

  fleetq::model::ProxyStatus status = fleetq::model::ProxyStatus::kAvailable;

  std::string locked_by;
  int64_t     locked_at_ms = 0;

  uint32_t uses_count   = 0;
  uint32_t blocks_count = 0;

  int64_t last_used_at_ms = 0;
  int64_t created_at_ms   = 0;
};

} // namespace fleetq::db::model
