#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace lifebank::model {

// Opaque account identifier (bank, hospital, admin, ...).
using Address   = std::string;
using UnitId    = std::uint64_t;
using Timestamp = lifebank::util::Timestamp;

} // namespace lifebank::model
