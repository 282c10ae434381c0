#pragma once

#include <stdexcept>
#include <string>

namespace gaitrank::util {

/*
  Central error types.

  The CLI maps these to exit codes; the ingest service maps them to
  per-race outcomes in the batch summary.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A race is older than the latest race already applied to its discipline.
class OutOfOrder : public std::runtime_error {
 public:
  explicit OutOfOrder(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Numerical failure inside the ranking update (degenerate truncation, tie with no draw margin).
class RatingUpdateError : public std::runtime_error {
 public:
  explicit RatingUpdateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace gaitrank::util
