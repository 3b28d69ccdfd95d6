#pragma once

#include <string>

#include "internal/outcome/classification.hpp"

namespace fleetq::processing {

// Parses one ProcessingReply JSON object. Malformed JSON or an unknown
// classification yields kUnexpected with the reason in failure_reason.
outcome::ProcessingOutcome ParseReply(const std::string& json);

} // namespace fleetq::processing
