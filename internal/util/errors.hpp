#pragma once

#include <stdexcept>
#include <string>

namespace durable::util {

/*
  Central error types.

  Stores translate db::Result codes into these; the scheduler logs them with
  the namespaced code from error_codes.hpp.
*/

// Backing store unreachable, busy or failing I/O. Never retried internally.
class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Stored bytes could not be decoded into the expected type.
class DeserializationError : public std::runtime_error {
 public:
  explicit DeserializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace durable::util
