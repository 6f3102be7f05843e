#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/blood_unit.hpp"
#include "internal/model/types.hpp"

namespace lifebank::model {

enum class CustodyStatus : std::uint8_t {
  kPending   = 0,
  kConfirmed = 1,
  kCancelled = 2,
};

/*
  One transfer attempt of a unit from its bank to the allocated hospital.
  Pending resolves exactly once; resolved events are immutable history.
*/
struct CustodyEvent {
  std::string   event_id;
  UnitId        unit_id = 0;
  CustodyStatus status  = CustodyStatus::kPending;

  Address   initiator;
  Address   counterparty;
  Timestamp created_at = 0;

  std::optional<Timestamp> resolved_at;

  // Unit status observed at initiation; restored on cancel.
  BloodStatus prior_status = BloodStatus::kReserved;
};

// Counts confirmed transfers only.
struct TrailMetadata {
  UnitId                   unit_id      = 0;
  std::uint64_t            total_events = 0;
  std::optional<Timestamp> last_confirmed_at;
};

std::string_view ToString(CustodyStatus status);

} // namespace lifebank::model
