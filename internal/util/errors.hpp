#pragma once

#include <stdexcept>
#include <string>

namespace refiner::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed upstream record; the record is quarantined, the batch proceeds.
class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Vulnerability feed could not be reached.
class FeedUnavailable : public std::runtime_error {
 public:
  explicit FeedUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Pipeline ordering bug. Never caught inside a run.
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::logic_error(msg) {
  }
};

} // namespace refiner::util
