#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/proxy_record.hpp"
#include "internal/db/model/replace_stats.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/util/time.hpp"

namespace fleetq::proxy {

/*
  ProxyPool

  Lease-based pool over the proxies relation. Claims pick the least used
  available proxy so load spreads evenly. A proxy whose block count reaches
  the threshold is blocked for good and never handed out again.
*/
class ProxyPool {
 public:
  ProxyPool(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t block_threshold = 3,
            uint32_t conflict_retries = 64);

  // Insert-if-absent after validating the connection string.
  // Returns false on duplicate; throws util::InvalidArgument when malformed.
  bool Add(const std::string& connection);

  // Drops every proxy, locked ones included, and adds `connections` in
  // their place in one transaction. Every entry is validated before
  // anything is removed; util::InvalidArgument on the first bad one.
  db::model::ReplaceStats ReplaceAll(const std::vector<std::string>& connections);

  std::optional<db::model::ProxyRecord> Claim(const std::string& worker_id);

  // Claim one specific proxy if it is still available.
  std::optional<db::model::ProxyRecord> ClaimPreferred(int64_t proxy_id, const std::string& worker_id);

  // Returns whether the caller still held the proxy.
  bool Release(int64_t proxy_id, const std::string& worker_id);

  // Counts one block against the proxy and frees it. Returns the updated
  // row, or std::nullopt when the caller no longer held it.
  std::optional<db::model::ProxyRecord> MarkBlocked(int64_t proxy_id, const std::string& worker_id);

  std::optional<db::model::ProxyRecord> Get(int64_t proxy_id);

  uint32_t BlockThreshold() const {
    return block_threshold_;
  }

 private:
  std::shared_ptr<db::Repository>             repository_;
  util::NowFn                                 now_;
  uint32_t                                    block_threshold_;
  uint32_t                                    conflict_retries_;
  lease::LeaseManager<db::model::ProxyRecord> leases_;
};

} // namespace fleetq::proxy
