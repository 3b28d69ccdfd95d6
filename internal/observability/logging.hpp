#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fleetq::runtime::config {
class RuntimeConfig;
}

namespace fleetq::observability {

/*
  Structured log lines:

    <message> key=value key="value with blanks"

  Level and pattern come from FLEETQ_LOG_LEVEL / FLEETQ_LOG_PATTERN, then
  the logging section of the config. InitializeLogging throws
  std::runtime_error on an unknown level name.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const fleetq::runtime::config::RuntimeConfig& config, std::string_view logger_name);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace fleetq::observability

#define FLEETQ_LOG_DEBUG(message, ...) ::fleetq::observability::LogDebug((message), ##__VA_ARGS__)
#define FLEETQ_LOG_INFO(message, ...) ::fleetq::observability::LogInfo((message), ##__VA_ARGS__)
#define FLEETQ_LOG_WARN(message, ...) ::fleetq::observability::LogWarn((message), ##__VA_ARGS__)
#define FLEETQ_LOG_ERROR(message, ...) ::fleetq::observability::LogError((message), ##__VA_ARGS__)
