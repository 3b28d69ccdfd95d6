#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/replace_stats.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/util/time.hpp"

namespace fleetq::queue {

/*
  TaskQueue

  Lease-based work queue over the tasks relation.

  pending --Claim--> processing --RecordSuccess--------> completed
                                --RecordAttemptFailure-> pending | failed
                                --Requeue--------------> pending

  Recording calls are guarded by (status=processing, owner=worker_id). A
  guard miss (task reclaimed by the reaper and handed to someone else,
  duplicate delivery) is a no-op reported to the caller, never an error.
*/
class TaskQueue {
 public:
  TaskQueue(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t conflict_retries = 64);

  // Insert-if-absent. Returns false when the item is already queued.
  bool Enqueue(int64_t item_id, uint32_t max_attempts);

  // Drops every task, whatever its status, and queues item_ids in their
  // place, all in one transaction. Repeated ids are queued once.
  db::model::ReplaceStats ReplaceAll(const std::vector<int64_t>& item_ids, uint32_t max_attempts);

  // Oldest pending task, or std::nullopt when the queue is drained.
  std::optional<db::model::TaskRecord> Claim(const std::string& worker_id);

  // processing -> completed. The result row must be stored first.
  bool RecordSuccess(int64_t task_id, const std::string& worker_id);

  // Consumes one attempt. Returns the updated row (pending or failed).
  std::optional<db::model::TaskRecord> RecordAttemptFailure(int64_t task_id, const std::string& worker_id);

  // Hands an unattempted task back without consuming an attempt.
  bool Requeue(int64_t task_id, const std::string& worker_id);

  std::optional<db::model::TaskRecord> Get(int64_t task_id);
  std::optional<db::model::TaskRecord> FindByItem(int64_t item_id);

 private:
  std::shared_ptr<db::Repository>             repository_;
  util::NowFn                                 now_;
  uint32_t                                    conflict_retries_;
  lease::LeaseManager<db::model::TaskRecord>  leases_;
};

} // namespace fleetq::queue
