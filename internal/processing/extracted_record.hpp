#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace fleetq::processing {

// Structured listing fields returned on content_found.
struct ExtractedRecord {
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
};

} // namespace fleetq::processing
