#pragma once

#include <cstdint>

#include "internal/util/time.hpp"

namespace lifebank::core {

/*
  Tunables of the custody subsystem. Built from the `custody` config
  section; zero values there keep these defaults.
*/
struct CustodyPolicy {
  // minimum age of a Pending transfer before the initiator may cancel it
  util::Timestamp cancel_cooldown_seconds = 30 * 60;

  std::uint32_t min_volume_ml = 100;
  std::uint32_t max_volume_ml = 600;

  util::Timestamp max_shelf_life_seconds = 42 * util::kSecondsPerDay;
};

} // namespace lifebank::core
