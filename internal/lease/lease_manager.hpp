#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fleetq::lease {

/*
  LeaseManager

  Grants exclusive ownership of one row out of a candidate set. The claim
  function selects, marks and returns the row inside the given transaction;
  the manager commits it and retries when the backend reports a
  TransactionConflict (another leaser won the race).

  Invariant: a committed lease is held by exactly one holder. std::nullopt
  means nothing was eligible, which is not an error.

  Throws util::LeaseConflict once max_attempts conflicting commits in a row
  have been seen.
*/
template <typename Record>
class LeaseManager {
 public:
  using ClaimFn = std::function<std::optional<Record>(db::Repository&, db::Transaction&, const std::string& holder,
                                                      int64_t now_ms)>;

  LeaseManager(std::shared_ptr<db::Repository> repository, ClaimFn claim, util::NowFn now, uint32_t max_attempts = 64)
      : repository_(std::move(repository)),
        claim_(std::move(claim)),
        now_(std::move(now)),
        max_attempts_(max_attempts == 0 ? 1 : max_attempts) {
  }

  std::optional<Record> Acquire(const std::string& holder) const {
    try {
      return db::RunInTransaction(*repository_, max_attempts_, [&](db::Transaction& tx) {
        return claim_(*repository_, tx, holder, util::ToUnixMillis(now_()));
      });
    } catch (const util::TransactionConflict& e) {
      throw util::LeaseConflict("lease for " + holder + " lost " + std::to_string(max_attempts_) +
                                " commit races: " + e.what());
    }
  }

  uint32_t MaxAttempts() const {
    return max_attempts_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  ClaimFn                         claim_;
  util::NowFn                     now_;
  uint32_t                        max_attempts_;
};

} // namespace fleetq::lease
