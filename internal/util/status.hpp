#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lifebank::util {

enum class ErrorCode {
  OK = 0,

  NotInitialized,
  AlreadyInitialized,
  Unauthorized,
  NotFound,
  InvalidState,
  InvalidInput,
  CooldownNotElapsed,

  Internal
};

std::string_view ErrorCodeName(ErrorCode code);

struct Status {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Status Ok() {
    return {};
  }

  static Status Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Value-or-status returned by the Try* entry points.
*/
template <typename T>
struct Outcome {
  Status           status;
  std::optional<T> value;

  static Outcome Ok(T v) {
    return {Status::Ok(), std::move(v)};
  }

  static Outcome Err(Status s) {
    return {std::move(s), std::nullopt};
  }

  explicit operator bool() const {
    return static_cast<bool>(status);
  }

  ErrorCode code() const {
    return status.code;
  }
};

// Converts the exceptions of errors.hpp into a Status; anything else is Internal.
Status ToStatus(const std::exception& e);

} // namespace lifebank::util
