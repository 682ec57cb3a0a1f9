#pragma once

#include <stdexcept>
#include <string>

namespace oncall::util {

/*
  Central error types.

  The CLI prints what() as a one-line diagnostic; the gRPC layer
  translates them to status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedInput : public std::runtime_error {
 public:
  explicit MalformedInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace oncall::util
