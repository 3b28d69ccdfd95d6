#pragma once

#include <string>

#include "config/config.pb.h"

namespace fleetq::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields receive
  their defaults, then FLEETQ_* environment variables override.
*/
class ConfigLoader {
 public:
  static fleetq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(fleetq::runtime::config::RuntimeConfig& config);
  static void ApplyEnvironmentOverrides(fleetq::runtime::config::RuntimeConfig& config);
};

} // namespace fleetq::config
