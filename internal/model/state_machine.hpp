#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fleetq::model {

/*
  Row lifecycles.

  Task:   pending -> processing -> {completed, pending, failed}
  Proxy:  available <-> locked -> blocked (terminal)
  Worker: active <-> stopped
*/

enum class TaskStatus : std::uint8_t {
  kPending    = 0,
  kProcessing = 1,
  kCompleted  = 2,
  kFailed     = 3,
};

enum class ProxyStatus : std::uint8_t {
  kAvailable = 0,
  kLocked    = 1,
  kBlocked   = 2,
};

enum class WorkerStatus : std::uint8_t {
  kActive  = 0,
  kStopped = 1,
};

// Only terminal outcomes are persisted as results.
enum class ResultStatus : std::uint8_t {
  kSuccess     = 0,
  kUnavailable = 1,
};

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kFailed;
}

constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == TaskStatus::kPending) {
    return to == TaskStatus::kProcessing || to == TaskStatus::kFailed;
  }
  // processing
  return to != TaskStatus::kProcessing;
}

constexpr bool CanTransition(ProxyStatus from, ProxyStatus to) {
  if (from == ProxyStatus::kBlocked) {
    return false;
  }
  return from != to;
}

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kProcessing:
      return "processing";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kFailed:
    default:
      return "failed";
  }
}

constexpr std::string_view ToString(ProxyStatus status) {
  switch (status) {
    case ProxyStatus::kAvailable:
      return "available";
    case ProxyStatus::kLocked:
      return "locked";
    case ProxyStatus::kBlocked:
    default:
      return "blocked";
  }
}

constexpr std::string_view ToString(WorkerStatus status) {
  return status == WorkerStatus::kActive ? "active" : "stopped";
}

constexpr std::string_view ToString(ResultStatus status) {
  return status == ResultStatus::kSuccess ? "success" : "unavailable";
}

std::optional<TaskStatus>   ParseTaskStatus(std::string_view text);
std::optional<ProxyStatus>  ParseProxyStatus(std::string_view text);
std::optional<WorkerStatus> ParseWorkerStatus(std::string_view text);
std::optional<ResultStatus> ParseResultStatus(std::string_view text);

} // namespace fleetq::model
