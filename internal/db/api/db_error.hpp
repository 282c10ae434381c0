#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace gaitrank::db {

// Converts a failed Result into the matching util exception.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message + " (" + std::string(ToString(result.code)) + ")");
  }
}

} // namespace gaitrank::db
