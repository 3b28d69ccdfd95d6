#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace fleetq::config {

using fleetq::runtime::config::RuntimeConfig;
using namespace std::chrono_literals;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults and environment
// ------------------------------------------------------------

namespace {

void DefaultDuration(google::protobuf::Duration* field, bool present, std::chrono::milliseconds value) {
  if (!present) {
    *field = util::ToProto(value);
  }
}

// Integer in [1, max] from the environment, or nothing when unset.
bool ReadPositiveEnv(const char* name, uint64_t max, uint64_t& out) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return false;
  }

  // strtoull accepts a sign, so require a leading digit
  char* endptr = nullptr;
  errno        = 0;
  const unsigned long long parsed = std::strtoull(raw, &endptr, 10);
  if (!std::isdigit(static_cast<unsigned char>(*raw)) || !endptr || *endptr != '\0' || parsed == 0) {
    throw std::runtime_error(std::string("Invalid value for ") + name + ": '" + raw + "'");
  }
  if (errno == ERANGE || parsed > max) {
    throw std::runtime_error(std::string("Value out of range for ") + name + ": '" + raw + "' (max " +
                             std::to_string(max) + ")");
  }
  out = parsed;
  return true;
}

void OverrideSeconds(const char* name, google::protobuf::Duration* field) {
  uint64_t seconds = 0;
  // protobuf caps Duration at 10000 years
  if (ReadPositiveEnv(name, 315576000000ULL, seconds)) {
    field->set_seconds(static_cast<int64_t>(seconds));
    field->set_nanos(0);
  }
}

void OverrideCount(const char* name, RuntimeConfig& config, void (*apply)(RuntimeConfig&, uint32_t)) {
  uint64_t value = 0;
  if (ReadPositiveEnv(name, std::numeric_limits<uint32_t>::max(), value)) {
    apply(config, static_cast<uint32_t>(value));
  }
}

} // namespace

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* worker = config.mutable_worker();
  if (worker->program_id().empty()) worker->set_program_id("fleetq_worker");
  if (worker->lanes() == 0) worker->set_lanes(15);
  if (worker->store_retry_attempts() == 0) worker->set_store_retry_attempts(5);
  DefaultDuration(worker->mutable_heartbeat_interval(), worker->has_heartbeat_interval(), 30s);
  DefaultDuration(worker->mutable_no_proxy_backoff(), worker->has_no_proxy_backoff(), 30s);
  DefaultDuration(worker->mutable_store_retry_delay(), worker->has_store_retry_delay(), 10s);

  auto* queue = config.mutable_queue();
  if (queue->max_task_attempts() == 0) queue->set_max_task_attempts(5);
  if (queue->claim_conflict_retries() == 0) queue->set_claim_conflict_retries(64);

  auto* proxies = config.mutable_proxies();
  if (proxies->block_threshold() == 0) proxies->set_block_threshold(3);

  auto* reaper = config.mutable_reaper();
  DefaultDuration(reaper->mutable_interval(), reaper->has_interval(), 60s);
  DefaultDuration(reaper->mutable_stale_task_after(), reaper->has_stale_task_after(), 600s);
  DefaultDuration(reaper->mutable_stale_lock_after(), reaper->has_stale_lock_after(), 300s);
  DefaultDuration(reaper->mutable_dead_worker_after(), reaper->has_dead_worker_after(), 240s);

  auto* processor = config.mutable_processor();
  DefaultDuration(processor->mutable_timeout(), processor->has_timeout(), 120s);

  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(16);
  }
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* uri = std::getenv("FLEETQ_DATABASE_URI")) {
    auto* postgres = config.mutable_database()->mutable_postgres();
    postgres->set_connection_uri(uri);
    if (postgres->max_connections() == 0) postgres->set_max_connections(16);
  }

  OverrideCount("FLEETQ_WORKER_LANES", config, [](RuntimeConfig& c, uint32_t v) { c.mutable_worker()->set_lanes(v); });
  OverrideCount("FLEETQ_MAX_TASK_ATTEMPTS", config, [](RuntimeConfig& c, uint32_t v) { c.mutable_queue()->set_max_task_attempts(v); });
  OverrideCount("FLEETQ_PROXY_BLOCK_THRESHOLD", config, [](RuntimeConfig& c, uint32_t v) { c.mutable_proxies()->set_block_threshold(v); });

  OverrideSeconds("FLEETQ_HEARTBEAT_INTERVAL_SEC", config.mutable_worker()->mutable_heartbeat_interval());
  OverrideSeconds("FLEETQ_REAPER_INTERVAL_SEC", config.mutable_reaper()->mutable_interval());
  OverrideSeconds("FLEETQ_STALE_TASK_SEC", config.mutable_reaper()->mutable_stale_task_after());
  OverrideSeconds("FLEETQ_STALE_LOCK_SEC", config.mutable_reaper()->mutable_stale_lock_after());
  OverrideSeconds("FLEETQ_DEAD_WORKER_SEC", config.mutable_reaper()->mutable_dead_worker_after());
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // An empty document is a valid "all defaults" config.
  if (yaml.IsDefined() && !yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  ApplyEnvironmentOverrides(config);
  return config;
}

} // namespace fleetq::config
