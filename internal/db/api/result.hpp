#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace refiner::db {

enum class ErrorCode {
  OK = 0,
  Busy,                // another process holds the cache file
  ConstraintViolation, // record rejected by the schema (empty id)
  IOError,
  Corruption,
  InternalError
};

/*
  Outcome of a cache write.

  Backends map their own error types onto ErrorCode. A failed write is
  logged by the caller and never fails a refinement run.
*/
struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;
  // rows written or removed
  std::size_t affected = 0;

  static Result Ok(std::size_t affected = 0) {
    Result result;
    result.affected = affected;
    return result;
  }

  static Result Err(ErrorCode code, std::string message) {
    Result result;
    result.code    = code;
    result.message = std::move(message);
    return result;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace refiner::db
