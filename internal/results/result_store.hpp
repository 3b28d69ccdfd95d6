#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/result_record.hpp"
#include "internal/util/time.hpp"

namespace fleetq::results {

/*
  Idempotent result sink keyed by item_id.

  Writing the same item twice leaves one row holding the latest values;
  created_at is kept from the first write, updated_at moves forward.
*/
class ResultStore {
 public:
  ResultStore(std::shared_ptr<db::Repository> repository, util::NowFn now, uint32_t conflict_retries = 64);

  void Upsert(const db::model::ResultRecord& record);

  std::optional<db::model::ResultRecord> Get(int64_t item_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
  uint32_t                        conflict_retries_;
};

} // namespace fleetq::results
