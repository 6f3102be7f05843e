#pragma once

#include <stdexcept>
#include <string>

namespace lifebank::util {

/*
  Central error types.

  Throwing entry points raise these; Try* entry points translate them
  into util::Status (see status.hpp).
*/

class NotInitialized : public std::runtime_error {
 public:
  explicit NotInitialized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyInitialized : public std::runtime_error {
 public:
  explicit AlreadyInitialized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthorized : public std::runtime_error {
 public:
  explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CooldownNotElapsed : public std::runtime_error {
 public:
  explicit CooldownNotElapsed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace lifebank::util
