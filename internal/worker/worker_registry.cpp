#include "worker_registry.hpp"

#include "internal/db/api/transaction_runner.hpp"

namespace fleetq::worker {

WorkerRegistry::WorkerRegistry(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t conflict_retries)
    : repository_(std::move(repository)), now_(std::move(now)), conflict_retries_(conflict_retries) {
}

void WorkerRegistry::Register(const std::string& worker_id) {
  auto result = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->UpsertWorker(tx, worker_id, util::ToUnixMillis(now_()));
  });
  db::ThrowIfDbError(result, "register worker " + worker_id);
}

void WorkerRegistry::Heartbeat(const std::string& worker_id) {
  auto result = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->TouchWorker(tx, worker_id, util::ToUnixMillis(now_()));
  });
  db::ThrowIfDbError(result, "heartbeat " + worker_id);
}

void WorkerRegistry::RecordOutcome(const std::string& worker_id, bool success) {
  auto result = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->IncrementWorkerCounter(tx, worker_id, success);
  });
  db::ThrowIfDbError(result, "record outcome " + worker_id);
}

void WorkerRegistry::MarkStopped(const std::string& worker_id) {
  auto result = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->StopWorker(tx, worker_id);
  });
  db::ThrowIfDbError(result, "stop worker " + worker_id);
}

std::optional<db::model::WorkerRecord> WorkerRegistry::Get(const std::string& worker_id) {
  return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->GetWorker(tx, worker_id);
  });
}

} // namespace fleetq::worker
