#include "proxy_lease.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/proxy/proxy_pool.hpp"
#include "internal/util/errors.hpp"

namespace fleetq::proxy {

std::optional<ProxyLease> ProxyLease::Acquire(ProxyPool& pool, const std::string& worker_id,
                                              std::optional<int64_t> preferred) {
  std::optional<db::model::ProxyRecord> record;
  if (preferred) record = pool.ClaimPreferred(*preferred, worker_id);
  if (!record) record = pool.Claim(worker_id);
  if (!record) return std::nullopt;

  ProxyEndpoint endpoint;
  try {
    endpoint = ParseProxyEndpoint(record->proxy);
  } catch (const util::InvalidArgument& e) {
    // unusable row: count it toward blocked so it stops being handed out
    FLEETQ_LOG_ERROR("malformed proxy in pool",
                     {observability::IntField("proxy_id", record->id), observability::StringField("error", e.what())});
    pool.MarkBlocked(record->id, worker_id);
    throw;
  }

  return ProxyLease(pool, worker_id, std::move(*record), std::move(endpoint));
}

ProxyLease::ProxyLease(ProxyPool& pool, std::string worker_id, db::model::ProxyRecord record, ProxyEndpoint endpoint)
    : pool_(&pool), worker_id_(std::move(worker_id)), record_(std::move(record)), endpoint_(std::move(endpoint)) {
}

ProxyLease::ProxyLease(ProxyLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      worker_id_(std::move(other.worker_id_)),
      record_(std::move(other.record_)),
      endpoint_(std::move(other.endpoint_)) {
}

ProxyLease& ProxyLease::operator=(ProxyLease&& other) noexcept {
  if (this != &other) {
    ReleaseQuietly();
    pool_      = std::exchange(other.pool_, nullptr);
    worker_id_ = std::move(other.worker_id_);
    record_    = std::move(other.record_);
    endpoint_  = std::move(other.endpoint_);
  }
  return *this;
}

ProxyLease::~ProxyLease() {
  ReleaseQuietly();
}

bool ProxyLease::Release() {
  if (!pool_) return false;
  auto* pool = std::exchange(pool_, nullptr);
  return pool->Release(record_.id, worker_id_);
}

std::optional<db::model::ProxyRecord> ProxyLease::Block() {
  if (!pool_) return std::nullopt;
  auto* pool    = std::exchange(pool_, nullptr);
  auto  updated = pool->MarkBlocked(record_.id, worker_id_);
  if (updated) record_ = *updated;
  return updated;
}

void ProxyLease::ReleaseQuietly() noexcept {
  if (!pool_) return;
  try {
    Release();
  } catch (const std::exception& e) {
    // the reaper frees the lock after stale_lock_after
    FLEETQ_LOG_WARN("proxy release failed",
                    {observability::IntField("proxy_id", record_.id), observability::StringField("worker_id", worker_id_),
                     observability::StringField("error", e.what())});
  } catch (...) {
    FLEETQ_LOG_WARN("proxy release failed",
                    {observability::IntField("proxy_id", record_.id), observability::StringField("worker_id", worker_id_),
                     observability::StringField("error", "non-standard exception")});
  }
}

} // namespace fleetq::proxy
