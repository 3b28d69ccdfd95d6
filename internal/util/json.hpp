#pragma once

#include <map>
#include <string>

namespace fleetq::util {

/*
  JSON helpers backed by google::protobuf::Struct.

  Used for the result characteristics column:
    postgres -> jsonb
    sqlite   -> text
*/

using StringMap = std::map<std::string, std::string>;

std::string EncodeStringMap(const StringMap& values);

// Empty input decodes to an empty map. Non-string values are rendered with
// their JSON text. Throws std::runtime_error on malformed JSON.
StringMap DecodeStringMap(const std::string& json);

} // namespace fleetq::util
