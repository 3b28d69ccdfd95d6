#include "task_queue.hpp"

#include "internal/db/api/transaction_runner.hpp"
#include "internal/util/errors.hpp"

namespace fleetq::queue {

TaskQueue::TaskQueue(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t conflict_retries)
    : repository_(std::move(repository)),
      now_(std::move(now)),
      conflict_retries_(conflict_retries),
      leases_(repository_,
              [](db::Repository& repo, db::Transaction& tx, const std::string& holder, int64_t now_ms) {
                return repo.ClaimTask(tx, holder, now_ms);
              },
              now_, conflict_retries) {
}

bool TaskQueue::Enqueue(int64_t item_id, uint32_t max_attempts) {
  if (max_attempts == 0) throw util::InvalidArgument("enqueue task: max_attempts must be positive");

  db::model::TaskRecord record;
  record.item_id       = item_id;
  record.max_attempts  = max_attempts;
  record.created_at_ms = util::ToUnixMillis(now_());

  auto result = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->InsertTask(tx, record);
  });
  if (result.code == db::ErrorCode::AlreadyExists) return false;
  db::ThrowIfDbError(result, "enqueue task");
  return true;
}

db::model::ReplaceStats TaskQueue::ReplaceAll(const std::vector<int64_t>& item_ids, uint32_t max_attempts) {
  if (max_attempts == 0) throw util::InvalidArgument("replace tasks: max_attempts must be positive");

  const int64_t now_ms = util::ToUnixMillis(now_());
  return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    db::model::ReplaceStats stats;
    stats.removed = repository_->DeleteAllTasks(tx);

    for (const auto item_id : item_ids) {
      db::model::TaskRecord record;
      record.item_id       = item_id;
      record.max_attempts  = max_attempts;
      record.created_at_ms = now_ms;

      auto result = repository_->InsertTask(tx, record);
      if (result.code == db::ErrorCode::AlreadyExists) {
        ++stats.duplicates;
        continue;
      }
      db::ThrowIfDbError(result, "replace tasks");
      ++stats.inserted;
    }
    return stats;
  });
}

std::optional<db::model::TaskRecord> TaskQueue::Claim(const std::string& worker_id) {
  return leases_.Acquire(worker_id);
}

bool TaskQueue::RecordSuccess(int64_t task_id, const std::string& worker_id) {
  auto updated = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->CompleteTask(tx, task_id, worker_id, util::ToUnixMillis(now_()));
  });
  return updated.has_value();
}

std::optional<db::model::TaskRecord> TaskQueue::RecordAttemptFailure(int64_t task_id, const std::string& worker_id) {
  return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->FailTaskAttempt(tx, task_id, worker_id);
  });
}

bool TaskQueue::Requeue(int64_t task_id, const std::string& worker_id) {
  auto updated = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->ReturnTask(tx, task_id, worker_id);
  });
  return updated.has_value();
}

std::optional<db::model::TaskRecord> TaskQueue::Get(int64_t task_id) {
  return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->GetTask(tx, task_id);
  });
}

std::optional<db::model::TaskRecord> TaskQueue::FindByItem(int64_t item_id) {
  return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->FindTaskByItem(tx, item_id);
  });
}

} // namespace fleetq::queue
