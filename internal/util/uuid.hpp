#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace lifebank::util {

/*
  UUID helpers

  Custody event ids are "evt-" followed by a random RFC4122 v4 UUID.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string GenerateEventId();

} // namespace lifebank::util
