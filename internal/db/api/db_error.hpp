#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace roadcast::db {

inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " [" + std::string(ToString(result.code)) + "]";
  if (!result.message.empty()) message += ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw roadcast::util::NotFound(message);
    case ErrorCode::ConstraintViolation:
      throw roadcast::util::Invalid(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace roadcast::db
