#include "result.hpp"

namespace sda::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::ConnectionLost:
      return "connection lost";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

std::string Result::Describe() const {
  if (message.empty()) return ToString(code);
  return std::string(ToString(code)) + ": " + message;
}

} // namespace sda::db
