#include "blood_unit.hpp"

#include <array>
#include <utility>

namespace lifebank::model {

namespace {

constexpr std::array<std::pair<BloodType, std::string_view>, 8> kBloodTypeNames = {{
    {BloodType::kAPositive, "A+"},
    {BloodType::kANegative, "A-"},
    {BloodType::kBPositive, "B+"},
    {BloodType::kBNegative, "B-"},
    {BloodType::kABPositive, "AB+"},
    {BloodType::kABNegative, "AB-"},
    {BloodType::kOPositive, "O+"},
    {BloodType::kONegative, "O-"},
}};

} // namespace

std::string_view ToString(BloodType type) {
  for (const auto& [value, name] : kBloodTypeNames) {
    if (value == type) return name;
  }
  return "unknown";
}

std::string_view ToString(BloodStatus status) {
  switch (status) {
    case BloodStatus::kAvailable:
      return "available";
    case BloodStatus::kReserved:
      return "reserved";
    case BloodStatus::kDelivered:
      return "delivered";
    case BloodStatus::kExpired:
      return "expired";
  }
  return "unknown";
}

std::optional<BloodType> ParseBloodType(std::string_view text) {
  for (const auto& [value, name] : kBloodTypeNames) {
    if (name == text) return value;
  }
  return std::nullopt;
}

} // namespace lifebank::model
