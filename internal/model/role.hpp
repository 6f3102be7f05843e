#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/types.hpp"

namespace lifebank::model {

enum class RoleKind : std::uint8_t {
  kAdmin     = 0,
  kHospital  = 1,
  kDonor     = 2,
  kRider     = 3,
  kBloodBank = 4,
  kCustom    = 5,
};

/*
  Tagged role. Custom roles carry a numeric id; for every other kind
  custom_id is 0.

  Ordering is by kind (declaration order) and then by custom_id, see
  CompareRoles(). Grant lists are kept sorted with this order.
*/
struct Role {
  RoleKind      kind      = RoleKind::kAdmin;
  std::uint32_t custom_id = 0;

  static constexpr Role Admin() {
    return {RoleKind::kAdmin, 0};
  }
  static constexpr Role Hospital() {
    return {RoleKind::kHospital, 0};
  }
  static constexpr Role Donor() {
    return {RoleKind::kDonor, 0};
  }
  static constexpr Role Rider() {
    return {RoleKind::kRider, 0};
  }
  static constexpr Role BloodBank() {
    return {RoleKind::kBloodBank, 0};
  }
  static constexpr Role Custom(std::uint32_t id) {
    return {RoleKind::kCustom, id};
  }
};

// <0, 0, >0 like strcmp.
int CompareRoles(const Role& lhs, const Role& rhs);

inline bool operator==(const Role& lhs, const Role& rhs) {
  return CompareRoles(lhs, rhs) == 0;
}

inline bool operator!=(const Role& lhs, const Role& rhs) {
  return CompareRoles(lhs, rhs) != 0;
}

std::string         ToString(const Role& role);
std::optional<Role> ParseRole(std::string_view text);

struct RoleGrant {
  Role                     role;
  Timestamp                granted_at = 0;
  std::optional<Timestamp> expires_at;
};

} // namespace lifebank::model
