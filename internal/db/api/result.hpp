#pragma once

#include <string>
#include <string_view>

namespace booking::db {

/*
  Portable store result codes.

  Backends translate their native errors into these; core code maps them
  onto domain errors in one place (core::ThrowIfDbError).
*/

enum class ErrorCode {
  OK = 0,

  NotFound,            // row absent
  Conflict,            // compare-and-set lost: the row moved on
  AlreadyExists,       // duplicate key
  ConstraintViolation, // CHECK / NOT NULL

  Busy, // lock held by another writer past the busy timeout; retryable

  IOError,
  Corruption,
  Unsupported, // write attempted in a read-only transaction
  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

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
    return code == ErrorCode::Busy;
  }
};

} // namespace booking::db
