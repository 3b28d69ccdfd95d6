#include "reply.hpp"

#include <google/protobuf/util/json_util.h>

#include "processing/processing_reply.pb.h"

namespace fleetq::processing {

namespace {

outcome::ProcessingOutcome Unexpected(std::string reason) {
  outcome::ProcessingOutcome out;
  out.classification = outcome::Classification::kUnexpected;
  out.failure_reason = std::move(reason);
  return out;
}

ExtractedRecord FromProto(const fleetq::processing::v1::ExtractedRecord& proto) {
  ExtractedRecord r;
  r.title       = proto.title();
  r.description = proto.description();
  r.characteristics.insert(proto.characteristics().begin(), proto.characteristics().end());
  if (proto.has_price()) r.price = proto.price();
  r.published_at       = proto.published_at();
  r.seller_name        = proto.seller_name();
  r.seller_profile_url = proto.seller_profile_url();
  r.location_address   = proto.location_address();
  r.location_metro     = proto.location_metro();
  r.location_region    = proto.location_region();
  if (proto.has_views_total()) r.views_total = proto.views_total();
  return r;
}

} // namespace

outcome::ProcessingOutcome ParseReply(const std::string& json) {
  fleetq::processing::v1::ProcessingReply reply;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &reply, options);
  if (!status.ok()) {
    return Unexpected("unparsable reply: " + status.ToString());
  }

  const auto classification = outcome::ParseClassification(reply.classification());
  if (!classification) {
    return Unexpected("unknown classification '" + reply.classification() + "'");
  }

  outcome::ProcessingOutcome out;
  out.classification = *classification;
  out.failure_reason = reply.failure_reason();

  if (!reply.after_resolution().empty()) {
    out.after_resolution = outcome::ParseClassification(reply.after_resolution());
    if (!out.after_resolution) out.after_resolution = outcome::Classification::kUnexpected;
  }

  if (reply.has_record()) out.record = FromProto(reply.record());
  return out;
}

} // namespace fleetq::processing
