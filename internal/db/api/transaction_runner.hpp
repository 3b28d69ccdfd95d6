#pragma once

#include <cstdint>
#include <string>
#include <thread>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace fleetq::db {

/*
  Runs `work(tx)` in a fresh transaction and commits.

  A util::TransactionConflict from Begin, the work itself or Commit restarts
  the unit of work, up to max_attempts times; the last conflict propagates.
  Any other exception rolls back (via the transaction destructor) and
  propagates.
*/
template <typename Work>
auto RunInTransaction(Repository& repository, uint32_t max_attempts, Work&& work)
    -> std::invoke_result_t<Work&, Transaction&> {
  using Value = std::invoke_result_t<Work&, Transaction&>;

  if (max_attempts == 0) max_attempts = 1;

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      auto tx = repository.Begin();
      if constexpr (std::is_void_v<Value>) {
        work(*tx);
        tx->Commit();
        return;
      } else {
        Value value = work(*tx);
        tx->Commit();
        return value;
      }
    } catch (const util::TransactionConflict&) {
      if (attempt >= max_attempts) throw;
      std::this_thread::yield();
    }
  }
}

} // namespace fleetq::db
