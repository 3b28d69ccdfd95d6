#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace fleetq::observability {
namespace {

// lanes log from their own threads, so the thread id is part of the line
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value && *value) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

spdlog::level::level_enum ParseLevel(const std::string& text) {
  const auto level = spdlog::level::from_str(text);
  // from_str maps anything it does not know to off
  if (level == spdlog::level::off && text != "off") {
    throw std::runtime_error("logging.level: unknown level '" + text + "'");
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\n':
        out.append("\\n");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const fleetq::runtime::config::RuntimeConfig& config, std::string_view logger_name) {
  const auto level   = ParseLevel(FromEnvOr("FLEETQ_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = FromEnvOr("FLEETQ_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  auto logger = spdlog::get(std::string(logger_name));
  if (!logger) logger = spdlog::stdout_color_mt(std::string(logger_name));

  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  const auto serialized = SerializeFields(fields);
  if (serialized.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized);
}

} // namespace fleetq::observability
