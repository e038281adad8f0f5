#pragma once

#include <stdexcept>
#include <string>

namespace impact::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Event store could not be reached. Retry policy belongs to the caller.
class ServiceUnavailable : public std::runtime_error {
 public:
  explicit ServiceUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace impact::util
