#pragma once

#include <string>

namespace sda::db {

/*
  Outcome of a repository write (MarkCompleted, MarkReady).

  Backends map their native failures onto ErrorCode so the workers can
  decide between requeue and reject without seeing pqxx or sqlite types.
  Conflict is the only code a worker treats as permanent.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  ConnectionLost,

  InternalError
};

const char* ToString(ErrorCode code);

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

  bool Permanent() const {
    return code == ErrorCode::Conflict;
  }

  // "<code>: <message>", for logs and error reports.
  std::string Describe() const;
};

} // namespace sda::db
