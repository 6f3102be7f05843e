#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/types.hpp"

namespace lifebank::model {

enum class BloodType : std::uint8_t {
  kAPositive  = 0,
  kANegative  = 1,
  kBPositive  = 2,
  kBNegative  = 3,
  kABPositive = 4,
  kABNegative = 5,
  kOPositive  = 6,
  kONegative  = 7,
};

enum class BloodStatus : std::uint8_t {
  kAvailable = 0,
  kReserved  = 1,
  kDelivered = 2,
  kExpired   = 3,
};

struct BloodUnit {
  UnitId        id         = 0;
  BloodType     blood_type = BloodType::kOPositive;
  std::uint32_t volume_ml  = 0;
  Timestamp     expiration = 0;
  BloodStatus   status     = BloodStatus::kAvailable;

  Address                    bank_id;
  std::optional<std::string> donor_id;
  Address                    current_custodian;

  // Hospital the unit is reserved for; set by allocation.
  std::optional<Address> allocated_to;
  Timestamp              registered_at = 0;
};

std::string_view         ToString(BloodType type);
std::string_view         ToString(BloodStatus status);
std::optional<BloodType> ParseBloodType(std::string_view text);

} // namespace lifebank::model
