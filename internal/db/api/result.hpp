#pragma once

#include <string>
#include <string_view>

namespace roadcast::db {

/*
  Backend-neutral outcome of a repository write.

  Each backend translates its own failures (sqlite result codes, pqxx
  exception types) into these; nothing above internal/db sees either.
  A natural-key collision is not an error: upserts report the surviving
  row instead.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  // CHECK / FOREIGN KEY / NOT NULL; the row was not written.
  ConstraintViolation,

  // Retryable contention.
  Busy,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal_error";
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

  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace roadcast::db
