#pragma once

#include <stdexcept>
#include <string>

namespace gate::util {

/*
  Central error types.

  Infrastructure code throws these; the pipeline translates them into
  rejection reasons and the HTTP layer into status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backing service (cache, database) unreachable or failing.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PayloadTooLarge : public std::runtime_error {
 public:
  explicit PayloadTooLarge(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace gate::util
