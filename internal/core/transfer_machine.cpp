#include "transfer_machine.hpp"

#include <algorithm>

#include "internal/db/api/result_check.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace lifebank::core {

using model::BloodStatus;
using model::CustodyStatus;

TransferMachine::TransferMachine(std::shared_ptr<db::Repository> repository, std::shared_ptr<BloodRegistry> registry,
                                 std::shared_ptr<const util::LedgerClock> clock, CustodyPolicy policy)
    : repository_(std::move(repository)), registry_(std::move(registry)), clock_(std::move(clock)), policy_(policy) {
}

model::CustodyEvent TransferMachine::Load(db::Transaction& tx, const std::string& event_id) {
  auto event = repository_->GetCustodyEvent(tx, event_id);
  if (!event.has_value()) {
    throw util::NotFound("custody event " + event_id + " not found");
  }
  return *event;
}

std::optional<model::CustodyEvent> TransferMachine::FindPending(db::Transaction& tx, model::UnitId unit_id) {
  for (auto& event : repository_->ListCustodyEvents(tx, unit_id)) {
    if (event.status == CustodyStatus::kPending) {
      return event;
    }
  }
  return std::nullopt;
}

model::CustodyEvent TransferMachine::Initiate(db::Transaction& tx, const model::Address& initiator, model::UnitId unit_id) {
  const auto unit = registry_->Load(tx, unit_id);

  if (unit.bank_id != initiator) {
    throw util::Unauthorized("initiate transfer: unit " + std::to_string(unit_id) + " belongs to another bank");
  }
  if (!model::PermitsTransfer(unit.status)) {
    throw util::InvalidState("initiate transfer: unit is " + std::string(model::ToString(unit.status)) + ", not reserved");
  }
  if (registry_->IsPastExpiration(unit)) {
    throw util::InvalidState("initiate transfer: unit has expired");
  }
  if (!unit.allocated_to.has_value()) {
    throw util::InvalidState("initiate transfer: unit has no allocated hospital");
  }
  if (auto pending = FindPending(tx, unit_id)) {
    throw util::InvalidState("initiate transfer: unit " + std::to_string(unit_id) + " already has pending transfer " + pending->event_id);
  }

  model::CustodyEvent event;
  event.event_id     = util::GenerateEventId();
  event.unit_id      = unit_id;
  event.status       = CustodyStatus::kPending;
  event.initiator    = initiator;
  event.counterparty = *unit.allocated_to;
  event.created_at   = clock_->Now();
  event.prior_status = unit.status;

  db::ThrowIfDbError(repository_->InsertCustodyEvent(tx, event), "initiate transfer");
  return event;
}

model::CustodyEvent TransferMachine::Confirm(db::Transaction& tx, const model::Address& confirmer, const std::string& event_id) {
  auto event = Load(tx, event_id);
  if (!model::CanTransition(event.status, CustodyStatus::kConfirmed)) {
    throw util::InvalidState("confirm transfer: event " + event_id + " is " + std::string(model::ToString(event.status)));
  }
  if (confirmer != event.counterparty) {
    throw util::Unauthorized("confirm transfer: caller is not the receiving party");
  }

  auto unit = registry_->Load(tx, event.unit_id);
  if (!model::CanTransition(unit.status, BloodStatus::kDelivered)) {
    throw util::InvalidState("confirm transfer: unit is " + std::string(model::ToString(unit.status)));
  }
  if (registry_->IsPastExpiration(unit)) {
    throw util::InvalidState("confirm transfer: unit has expired");
  }

  auto       trail = TrailFor(tx, event.unit_id);
  const auto now   = clock_->Now();

  event.status      = CustodyStatus::kConfirmed;
  event.resolved_at = now;

  unit.current_custodian = confirmer;

  trail.total_events += 1;
  trail.last_confirmed_at = now;

  db::ThrowIfDbError(repository_->UpdateCustodyEvent(tx, event), "confirm transfer");
  registry_->Transition(tx, unit, BloodStatus::kDelivered);
  db::ThrowIfDbError(repository_->UpsertTrailMetadata(tx, trail), "update custody trail");
  return event;
}

model::CustodyEvent TransferMachine::Cancel(db::Transaction& tx, const model::Address& canceller, const std::string& event_id) {
  auto event = Load(tx, event_id);
  if (!model::CanTransition(event.status, CustodyStatus::kCancelled)) {
    throw util::InvalidState("cancel transfer: event " + event_id + " is " + std::string(model::ToString(event.status)));
  }
  if (canceller != event.initiator) {
    throw util::Unauthorized("cancel transfer: caller did not initiate the transfer");
  }

  const auto now = clock_->Now();
  if (now < event.created_at + policy_.cancel_cooldown_seconds) {
    throw util::CooldownNotElapsed("cancel transfer: cooldown ends at " + std::to_string(event.created_at + policy_.cancel_cooldown_seconds));
  }

  auto unit = registry_->Load(tx, event.unit_id);
  if (!model::CanTransition(unit.status, event.prior_status)) {
    throw util::InvalidState("cancel transfer: unit is " + std::string(model::ToString(unit.status)));
  }

  event.status      = CustodyStatus::kCancelled;
  event.resolved_at = now;

  db::ThrowIfDbError(repository_->UpdateCustodyEvent(tx, event), "cancel transfer");
  registry_->Transition(tx, unit, event.prior_status);
  return event;
}

model::TrailMetadata TransferMachine::TrailFor(db::Transaction& tx, model::UnitId unit_id) {
  auto trail = repository_->GetTrailMetadata(tx, unit_id);
  if (trail.has_value()) {
    return *trail;
  }
  model::TrailMetadata empty;
  empty.unit_id = unit_id;
  return empty;
}

std::vector<model::CustodyEvent> TransferMachine::ConfirmedEvents(db::Transaction& tx, model::UnitId unit_id) {
  auto events = repository_->ListCustodyEvents(tx, unit_id);
  events.erase(std::remove_if(events.begin(), events.end(), [](const auto& e) { return e.status != CustodyStatus::kConfirmed; }),
               events.end());
  return events;
}

} // namespace lifebank::core
