#include "proxy_pool.hpp"

#include "internal/db/api/transaction_runner.hpp"
#include "internal/proxy/proxy_endpoint.hpp"

namespace fleetq::proxy {

ProxyPool::ProxyPool(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t block_threshold,
                     uint32_t conflict_retries)
    : repository_(std::move(repository)),
      now_(std::move(now)),
      block_threshold_(block_threshold == 0 ? 1 : block_threshold),
      conflict_retries_(conflict_retries),
      leases_(repository_,
              [](db::Repository& repo, db::Transaction& tx, const std::string& holder, int64_t now_ms) {
                return repo.ClaimProxy(tx, holder, now_ms);
              },
              now_, conflict_retries) {
}

bool ProxyPool::Add(const std::string& connection) {
  ParseProxyEndpoint(connection);

  db::model::ProxyRecord record;
  record.proxy         = connection;
  record.created_at_ms = util::ToUnixMillis(now_());

  auto result = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->InsertProxy(tx, record);
  });
  if (result.code == db::ErrorCode::AlreadyExists) return false;
  db::ThrowIfDbError(result, "add proxy");
  return true;
}

db::model::ReplaceStats ProxyPool::ReplaceAll(const std::vector<std::string>& connections) {
  for (const auto& connection : connections) ParseProxyEndpoint(connection);

  const int64_t now_ms = util::ToUnixMillis(now_());
  return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    db::model::ReplaceStats stats;
    stats.removed = repository_->DeleteAllProxies(tx);

    for (const auto& connection : connections) {
      db::model::ProxyRecord record;
      record.proxy         = connection;
      record.created_at_ms = now_ms;

      auto result = repository_->InsertProxy(tx, record);
      if (result.code == db::ErrorCode::AlreadyExists) {
        ++stats.duplicates;
        continue;
      }
      db::ThrowIfDbError(result, "replace proxies");
      ++stats.inserted;
    }
    return stats;
  });
}

std::optional<db::model::ProxyRecord> ProxyPool::Claim(const std::string& worker_id) {
  return leases_.Acquire(worker_id);
}

std::optional<db::model::ProxyRecord> ProxyPool::ClaimPreferred(int64_t proxy_id, const std::string& worker_id) {
  try {
    return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
      return repository_->ClaimProxyById(tx, proxy_id, worker_id, util::ToUnixMillis(now_()));
    });
  } catch (const util::TransactionConflict& e) {
    throw util::LeaseConflict("proxy " + std::to_string(proxy_id) + " for " + worker_id + ": " + e.what());
  }
}

bool ProxyPool::Release(int64_t proxy_id, const std::string& worker_id) {
  auto updated = db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->ReleaseProxy(tx, proxy_id, worker_id, util::ToUnixMillis(now_()));
  });
  return updated.has_value();
}

std::optional<db::model::ProxyRecord> ProxyPool::MarkBlocked(int64_t proxy_id, const std::string& worker_id) {
  return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->BlockProxy(tx, proxy_id, worker_id, block_threshold_, util::ToUnixMillis(now_()));
  });
}

std::optional<db::model::ProxyRecord> ProxyPool::Get(int64_t proxy_id) {
  return db::RunInTransaction(*repository_, conflict_retries_, [&](db::Transaction& tx) {
    return repository_->GetProxy(tx, proxy_id);
  });
}

} // namespace fleetq::proxy
