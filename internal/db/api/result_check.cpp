#include "internal/db/api/result_check.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace lifebank::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw lifebank::util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::Conflict:
      throw lifebank::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace lifebank::db
