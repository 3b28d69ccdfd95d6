#include "outcome_policy.hpp"

#include "internal/util/errors.hpp"

namespace fleetq::outcome {

namespace {

Decision Terminal(Classification effective, model::ResultStatus status) {
  Decision d;
  d.terminal      = true;
  d.result_status = status;
  d.effective     = effective;
  return d;
}

Decision Retry(Classification effective, bool rotate) {
  Decision d;
  d.rotate    = rotate;
  d.effective = effective;
  return d;
}

Decision DecideContent(Classification c, const ProcessingOutcome& outcome) {
  switch (c) {
    case Classification::kContentFound:
      if (!outcome.record) return Retry(Classification::kExtractionFailed, false);
      return Terminal(c, model::ResultStatus::kSuccess);
    case Classification::kContentRemoved:
      return Terminal(c, model::ResultStatus::kUnavailable);
    default:
      return Retry(c, false);
  }
}

} // namespace

Decision Decide(const ProcessingOutcome& outcome) {
  switch (outcome.classification) {
    case Classification::kBlockedHard:
    case Classification::kRateLimitedUnresolved:
      return Retry(outcome.classification, true);

    case Classification::kRateLimitedResolvedThen:
      // anything but found / removed after resolution retries on the same proxy
      return DecideContent(outcome.after_resolution.value_or(Classification::kUnexpected), outcome);

    case Classification::kContentFound:
    case Classification::kContentRemoved:
      return DecideContent(outcome.classification, outcome);

    case Classification::kExtractionFailed:
    case Classification::kUnexpected:
    default:
      return Retry(outcome.classification, false);
  }
}

db::model::ResultRecord BuildResult(const db::model::TaskRecord& task, const std::string& worker_id,
                                    const ProcessingOutcome& outcome, const Decision& decision, int64_t now_ms) {
  if (!decision.terminal || !decision.result_status) {
    throw util::InvalidArgument("build result: decision for item " + std::to_string(task.item_id) + " is not terminal");
  }

  db::model::ResultRecord r;
  r.item_id         = task.item_id;
  r.status          = *decision.result_status;
  r.worker_id       = worker_id;
  r.attempts        = task.attempts + 1;
  r.processed_at_ms = now_ms;

  if (r.status == model::ResultStatus::kSuccess && outcome.record) {
    const auto& rec      = *outcome.record;
    r.title              = rec.title;
    r.description        = rec.description;
    r.characteristics    = rec.characteristics;
    r.price              = rec.price;
    r.published_at       = rec.published_at;
    r.seller_name        = rec.seller_name;
    r.seller_profile_url = rec.seller_profile_url;
    r.location_address   = rec.location_address;
    r.location_metro     = rec.location_metro;
    r.location_region    = rec.location_region;
    r.views_total        = rec.views_total;
  }
  return r;
}

} // namespace fleetq::outcome
