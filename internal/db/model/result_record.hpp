#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace fleetq::db::model {

/*
  Extraction result, keyed by item_id.

  Stored as:
    characteristics -> jsonb (postgres) / text (sqlite) / map (memory)
  Empty strings are written as NULL.
*/

struct ResultRecord {
  int64_t item_id = 0;

  std::string                        title;
  std::string                        description;
  std::map<std::string, std::string> characteristics;
  std::optional<double>              price;
  std::string                        published_at;

  std::string seller_name;
  std::string seller_profile_url;

  std::string location_address;
  std::string location_metro;
  std::string location_region;

  std::optional<int64_t> views_total;

  fleetq::model::ResultStatus status = fleetq::model::ResultStatus::kSuccess;
  std::string                 failure_reason;

  std::string worker_id;
  uint32_t    attempts = 1;

  int64_t processed_at_ms = 0;
  int64_t created_at_ms   = 0;
  int64_t updated_at_ms   = 0;
};

} // namespace fleetq::db::model
