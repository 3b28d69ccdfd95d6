#pragma once

#include <optional>
#include <string>

#include "internal/db/model/proxy_record.hpp"
#include "internal/proxy/proxy_endpoint.hpp"

namespace fleetq::proxy {

class ProxyPool;

/*
  Scoped hold on one proxy.

  The destructor releases the proxy unless Release() or Block() already
  ended the hold. A release failing there is logged and the lock is left
  for the reaper. Move-only; a moved-from lease owns nothing.
*/
class ProxyLease {
 public:
  // Claims `preferred` when given and still available, otherwise the least
  // used available proxy. std::nullopt when the pool is exhausted.
  static std::optional<ProxyLease> Acquire(ProxyPool& pool, const std::string& worker_id,
                                           std::optional<int64_t> preferred = std::nullopt);

  ProxyLease(ProxyLease&& other) noexcept;
  ProxyLease& operator=(ProxyLease&& other) noexcept;
  ProxyLease(const ProxyLease&)            = delete;
  ProxyLease& operator=(const ProxyLease&) = delete;
  ~ProxyLease();

  const db::model::ProxyRecord& Record() const {
    return record_;
  }
  const ProxyEndpoint& Endpoint() const {
    return endpoint_;
  }
  int64_t Id() const {
    return record_.id;
  }
  bool Active() const {
    return pool_ != nullptr;
  }

  // Ends the hold, proxy back to available.
  bool Release();

  // Ends the hold counting one block; returns the updated row.
  std::optional<db::model::ProxyRecord> Block();

 private:
  ProxyLease(ProxyPool& pool, std::string worker_id, db::model::ProxyRecord record, ProxyEndpoint endpoint);

  void ReleaseQuietly() noexcept;

  ProxyPool*             pool_ = nullptr;
  std::string            worker_id_;
  db::model::ProxyRecord record_;
  ProxyEndpoint          endpoint_;
};

} // namespace fleetq::proxy
