#include "json.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace fleetq::util {

std::string EncodeStringMap(const StringMap& values) {
  google::protobuf::Struct object;
  auto&                    fields = *object.mutable_fields();
  for (const auto& [key, value] : values) {
    fields[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode JSON object: " + std::string(status.message()));
  }
  return json;
}

StringMap DecodeStringMap(const std::string& json) {
  StringMap out;
  if (json.empty()) {
    return out;
  }

  google::protobuf::Struct object;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &object);
  if (!status.ok()) {
    throw std::runtime_error("Failed to decode JSON object: " + std::string(status.message()));
  }

  for (const auto& [key, value] : object.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      out[key] = value.string_value();
      continue;
    }

    std::string rendered;
    auto        render_status = google::protobuf::util::MessageToJsonString(value, &rendered);
    if (!render_status.ok()) {
      throw std::runtime_error("Failed to render JSON value: " + std::string(render_status.message()));
    }
    out[key] = rendered;
  }
  return out;
}

} // namespace fleetq::util
