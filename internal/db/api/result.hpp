#pragma once

#include <string>
#include <string_view>

namespace fleetq::db {

/*
  Outcome of a repository write.

  Backends map their native failures (sqlite result codes, pqxx exceptions)
  onto ErrorCode so nothing above the repository sees backend types. Busy
  and SerializationFailure mean a concurrent writer won: ThrowIfDbError
  turns them into util::TransactionConflict and the unit of work is rerun.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,

  Busy,
  SerializationFailure,

  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

std::string_view ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }
};

// Throws the util/errors.hpp type matching result.code; no-op on OK.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace fleetq::db
