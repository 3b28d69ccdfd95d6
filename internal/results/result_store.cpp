#include "result_store.hpp"

#include "internal/db/api/transaction_runner.hpp"

namespace fleetq::results {

ResultStore::ResultStore(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t conflict_retries)
    : repository_(std::move(repository)), now_(std::move(now)), conflict_retries_(conflict_retries) {
}

void ResultStore::Upsert(const db::model::ResultRecord& record) {
  auto result = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->UpsertResult(tx, record, util::ToUnixMillis(now_()));
  });
  db::ThrowIfDbError(result, "upsert result for item " + std::to_string(record.item_id));
}

std::optional<db::model::ResultRecord> ResultStore::Get(int64_t item_id) {
  return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->GetResult(tx, item_id);
  });
}

} // namespace fleetq::results
