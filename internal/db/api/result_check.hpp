#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace lifebank::db {

// Raises the util:: exception matching a failed Result; no-op on success.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace lifebank::db
