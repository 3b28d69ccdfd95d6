#include "classification.hpp"

#include <array>
#include <utility>

namespace fleetq::outcome {

namespace {

constexpr std::array<std::pair<Classification, std::string_view>, 7> kNames = {{
    {Classification::kBlockedHard, "blocked_hard"},
    {Classification::kRateLimitedUnresolved, "rate_limited_unresolved"},
    {Classification::kRateLimitedResolvedThen, "rate_limited_resolved_then"},
    {Classification::kContentFound, "content_found"},
    {Classification::kContentRemoved, "content_removed"},
    {Classification::kExtractionFailed, "extraction_failed"},
    {Classification::kUnexpected, "unexpected"},
}};

} // namespace

std::string_view ToString(Classification c) {
  for (const auto& [value, name] : kNames) {
    if (value == c) return name;
  }
  return "unexpected";
}

std::optional<Classification> ParseClassification(std::string_view text) {
  for (const auto& [value, name] : kNames) {
    if (name == text) return value;
  }
  return std::nullopt;
}

} // namespace fleetq::outcome
