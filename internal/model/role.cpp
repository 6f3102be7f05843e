#include "role.hpp"

#include <charconv>

namespace lifebank::model {

int CompareRoles(const Role& lhs, const Role& rhs) {
  const auto lk = static_cast<std::uint8_t>(lhs.kind);
  const auto rk = static_cast<std::uint8_t>(rhs.kind);
  if (lk != rk) {
    return lk < rk ? -1 : 1;
  }
  if (lhs.kind != RoleKind::kCustom || lhs.custom_id == rhs.custom_id) {
    return 0;
  }
  return lhs.custom_id < rhs.custom_id ? -1 : 1;
}

std::string ToString(const Role& role) {
  switch (role.kind) {
    case RoleKind::kAdmin:
      return "admin";
    case RoleKind::kHospital:
      return "hospital";
    case RoleKind::kDonor:
      return "donor";
    case RoleKind::kRider:
      return "rider";
    case RoleKind::kBloodBank:
      return "blood_bank";
    case RoleKind::kCustom:
      return "custom:" + std::to_string(role.custom_id);
  }
  return "unknown";
}

// Accepts the ToString() spelling, e.g. "hospital" or "custom:7".
std::optional<Role> ParseRole(std::string_view text) {
  if (text == "admin") return Role::Admin();
  if (text == "hospital") return Role::Hospital();
  if (text == "donor") return Role::Donor();
  if (text == "rider") return Role::Rider();
  if (text == "blood_bank") return Role::BloodBank();

  constexpr std::string_view kCustomPrefix = "custom:";
  if (text.substr(0, kCustomPrefix.size()) != kCustomPrefix) {
    return std::nullopt;
  }

  const auto    digits = text.substr(kCustomPrefix.size());
  std::uint32_t id     = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
  if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return Role::Custom(id);
}

} // namespace lifebank::model
