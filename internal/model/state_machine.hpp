#pragma once

#include "internal/model/blood_unit.hpp"
#include "internal/model/custody_event.hpp"

namespace lifebank::model {

constexpr bool IsTerminal(BloodStatus status) {
  return status == BloodStatus::kDelivered || status == BloodStatus::kExpired;
}

/*
  Unit lattice:
    Available -> Reserved -> Delivered
    Available | Reserved -> Expired

  Reserved -> Reserved is the cancel path (status restored, not advanced).
*/
constexpr bool CanTransition(BloodStatus from, BloodStatus to) {
  if (from == to) {
    return !IsTerminal(from);
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == BloodStatus::kExpired) {
    return true;
  }
  if (to == BloodStatus::kAvailable) {
    return false;
  }

  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr bool IsTerminal(CustodyStatus status) {
  return status != CustodyStatus::kPending;
}

constexpr bool CanTransition(CustodyStatus from, CustodyStatus to) {
  return from == CustodyStatus::kPending && to != CustodyStatus::kPending;
}

// Only reserved units may enter a transfer.
constexpr bool PermitsTransfer(BloodStatus status) {
  return status == BloodStatus::kReserved;
}

} // namespace lifebank::model
