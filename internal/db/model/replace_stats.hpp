#pragma once

#include <cstdint>

namespace fleetq::db::model {

// Outcome of swapping a whole relation for a new set of rows.
struct ReplaceStats {
  uint64_t removed    = 0;
  uint64_t inserted   = 0;
  uint64_t duplicates = 0; // repeated within the new set
};

} // namespace fleetq::db::model
