#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/processing/extracted_record.hpp"

namespace fleetq::outcome {

// Closed set of per-attempt outcomes reported by the processing side.
enum class Classification : std::uint8_t {
  kBlockedHard             = 0,
  kRateLimitedUnresolved   = 1,
  kRateLimitedResolvedThen = 2, // see ProcessingOutcome::after_resolution
  kContentFound            = 3,
  kContentRemoved          = 4,
  kExtractionFailed        = 5,
  kUnexpected              = 6,
};

std::string_view              ToString(Classification c);
std::optional<Classification> ParseClassification(std::string_view text);

struct ProcessingOutcome {
  Classification classification = Classification::kUnexpected;

  // Set when classification is kRateLimitedResolvedThen.
  std::optional<Classification> after_resolution;

  // Set on content_found (directly or after resolution).
  std::optional<processing::ExtractedRecord> record;

  std::string failure_reason;
};

} // namespace fleetq::outcome
