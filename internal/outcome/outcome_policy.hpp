#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/result_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/outcome/classification.hpp"

namespace fleetq::outcome {

/*
  Outcome policy

  Maps one attempt's classification to what the lane does next:

    classification                 terminal rotate result
    blocked_hard                   no       yes    -
    rate_limited_unresolved        no       yes    -
    resolved_then(content_found)   yes      no     success
    resolved_then(content_removed) yes      no     unavailable
    resolved_then(other)           no       no     -
    content_found                  yes      no     success
    content_removed                yes      no     unavailable
    extraction_failed              no       no     -
    unexpected                     no       no     -

  content_found without a record is downgraded to extraction_failed.
*/
struct Decision {
  bool terminal = false;
  bool rotate   = false;

  // Set iff terminal.
  std::optional<model::ResultStatus> result_status;

  // Classification the decision was taken on, after resolution and
  // downgrades. Used for logging.
  Classification effective = Classification::kUnexpected;
};

Decision Decide(const ProcessingOutcome& outcome);

// Result row for a terminal decision. attempts counts the successful attempt.
db::model::ResultRecord BuildResult(const db::model::TaskRecord& task, const std::string& worker_id,
                                    const ProcessingOutcome& outcome, const Decision& decision, int64_t now_ms);

} // namespace fleetq::outcome
