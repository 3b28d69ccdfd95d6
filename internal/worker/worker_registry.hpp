#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/worker_record.hpp"
#include "internal/util/time.hpp"

namespace fleetq::worker {

/*
  WorkerRegistry

  Liveness rows for lanes. The heartbeat never moves backwards, so a slow
  refresh that commits late cannot make a live worker look older.
*/
class WorkerRegistry {
 public:
  WorkerRegistry(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t conflict_retries = 64);

  void Register(const std::string& worker_id);
  // Throws util::NotFound for an unregistered id.
  void Heartbeat(const std::string& worker_id);
  void RecordOutcome(const std::string& worker_id, bool success);
  void MarkStopped(const std::string& worker_id);

  std::optional<db::model::WorkerRecord> Get(const std::string& worker_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
  uint32_t                        conflict_retries_;
};

} // namespace fleetq::worker
