#include "status.hpp"

#include "internal/util/errors.hpp"

namespace lifebank::util {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotInitialized:
      return "not_initialized";
    case ErrorCode::AlreadyInitialized:
      return "already_initialized";
    case ErrorCode::Unauthorized:
      return "unauthorized";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::InvalidState:
      return "invalid_state";
    case ErrorCode::InvalidInput:
      return "invalid_input";
    case ErrorCode::CooldownNotElapsed:
      return "cooldown_not_elapsed";
    case ErrorCode::Internal:
      return "internal";
  }
  return "internal";
}

Status ToStatus(const std::exception& e) {
  if (dynamic_cast<const NotInitialized*>(&e)) {
    return Status::Err(ErrorCode::NotInitialized, e.what());
  }
  if (dynamic_cast<const AlreadyInitialized*>(&e)) {
    return Status::Err(ErrorCode::AlreadyInitialized, e.what());
  }
  if (dynamic_cast<const Unauthorized*>(&e)) {
    return Status::Err(ErrorCode::Unauthorized, e.what());
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return Status::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return Status::Err(ErrorCode::InvalidState, e.what());
  }
  if (dynamic_cast<const InvalidInput*>(&e)) {
    return Status::Err(ErrorCode::InvalidInput, e.what());
  }
  if (dynamic_cast<const CooldownNotElapsed*>(&e)) {
    return Status::Err(ErrorCode::CooldownNotElapsed, e.what());
  }

  return Status::Err(ErrorCode::Internal, e.what());
}

} // namespace lifebank::util
