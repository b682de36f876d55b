#pragma once

#include <stdexcept>
#include <string>

namespace outbox::util {

/*
  Central error types.

  Repository code reports db::Result codes; everything above the
  repository layer raises these.
*/

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

// State row or pending row changed since it was read.
class ConcurrencyConflict : public std::runtime_error {
 public:
  explicit ConcurrencyConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by delivery channels that reject a send.
class DeliveryFailure : public std::runtime_error {
 public:
  explicit DeliveryFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace outbox::util
