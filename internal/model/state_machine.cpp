#include "state_machine.hpp"

namespace fleetq::model {

std::optional<TaskStatus> ParseTaskStatus(std::string_view text) {
  for (auto status : {TaskStatus::kPending, TaskStatus::kProcessing, TaskStatus::kCompleted, TaskStatus::kFailed}) {
    if (ToString(status) == text) return status;
  }
  return std::nullopt;
}

std::optional<ProxyStatus> ParseProxyStatus(std::string_view text) {
  for (auto status : {ProxyStatus::kAvailable, ProxyStatus::kLocked, ProxyStatus::kBlocked}) {
    if (ToString(status) == text) return status;
  }
  return std::nullopt;
}

std::optional<WorkerStatus> ParseWorkerStatus(std::string_view text) {
  if (text == "active") return WorkerStatus::kActive;
  if (text == "stopped") return WorkerStatus::kStopped;
  return std::nullopt;
}

std::optional<ResultStatus> ParseResultStatus(std::string_view text) {
  if (text == "success") return ResultStatus::kSuccess;
  if (text == "unavailable") return ResultStatus::kUnavailable;
  return std::nullopt;
}

} // namespace fleetq::model
