#include "health_chain.hpp"

#include "internal/db/api/instance_keys.hpp"
#include "internal/db/api/result_check.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/try_call.hpp"

namespace lifebank::core {

using lifebank::observability::StringField;
using lifebank::observability::UintField;

HealthChain::HealthChain(std::shared_ptr<db::Repository> repository, std::shared_ptr<access::RoleStore> roles,
                         std::shared_ptr<const util::LedgerClock> clock, CustodyPolicy policy)
    : repository_(std::move(repository)),
      roles_(std::move(roles)),
      clock_(std::move(clock)),
      registry_(std::make_shared<BloodRegistry>(repository_, clock_, policy)),
      transfers_(std::make_unique<TransferMachine>(repository_, registry_, clock_, policy)) {
}

// ------------------------------------------------------------
// Guards
// ------------------------------------------------------------

model::Address HealthChain::RequireInitialized(db::Transaction& tx) {
  auto admin = repository_->GetInstanceValue(tx, db::keys::kHealthChainAdmin);
  if (!admin.has_value()) {
    throw util::NotInitialized("health chain is not initialized");
  }
  return *admin;
}

void HealthChain::RequireAdmin(db::Transaction& tx, const model::Address& caller) {
  if (RequireInitialized(tx) != caller) {
    throw util::Unauthorized("caller " + caller + " is not the health chain admin");
  }
}

void HealthChain::RequireRole(db::Transaction& tx, const model::Address& address, const model::Role& role) {
  if (!roles_->HasRoleInTx(tx, address, role)) {
    throw util::Unauthorized(address + " does not hold role " + model::ToString(role));
  }
}

// ------------------------------------------------------------
// Setup
// ------------------------------------------------------------

void HealthChain::Initialize(const model::Address& admin) {
  auto tx = repository_->Begin();
  if (repository_->GetInstanceValue(*tx, db::keys::kHealthChainAdmin).has_value()) {
    throw util::AlreadyInitialized("initialize health chain: admin already set");
  }
  db::ThrowIfDbError(repository_->PutInstanceValue(*tx, db::keys::kHealthChainAdmin, admin), "initialize health chain");
  tx->Commit();

  LIFEBANK_LOG_INFO("health chain initialized", {StringField("admin", admin)});
}

void HealthChain::RegisterBloodBank(const model::Address& caller, const model::Address& bank) {
  auto tx = repository_->Begin();
  RequireAdmin(*tx, caller);
  roles_->GrantInTx(*tx, bank, model::Role::BloodBank(), std::nullopt);
  tx->Commit();

  LIFEBANK_LOG_INFO("blood bank registered", {StringField("bank", bank)});
}

void HealthChain::RegisterHospital(const model::Address& caller, const model::Address& hospital) {
  auto tx = repository_->Begin();
  RequireAdmin(*tx, caller);
  roles_->GrantInTx(*tx, hospital, model::Role::Hospital(), std::nullopt);
  tx->Commit();

  LIFEBANK_LOG_INFO("hospital registered", {StringField("hospital", hospital)});
}

// ------------------------------------------------------------
// Units
// ------------------------------------------------------------

model::UnitId HealthChain::RegisterBlood(const model::Address& bank, model::BloodType type, std::uint32_t volume_ml,
                                         model::Timestamp expiration, const std::optional<std::string>& donor_id) {
  auto tx = repository_->Begin();
  RequireInitialized(*tx);
  RequireRole(*tx, bank, model::Role::BloodBank());

  const auto id = registry_->Register(*tx, bank, type, volume_ml, expiration, donor_id);
  tx->Commit();

  LIFEBANK_LOG_INFO("blood registered", {UintField("unit_id", id), StringField("bank", bank), StringField("blood_type", model::ToString(type)),
                                         UintField("volume_ml", volume_ml), UintField("expiration", expiration)});
  return id;
}

void HealthChain::AllocateBlood(const model::Address& bank, model::UnitId unit_id, const model::Address& hospital) {
  auto tx = repository_->Begin();
  RequireInitialized(*tx);
  RequireRole(*tx, bank, model::Role::BloodBank());
  RequireRole(*tx, hospital, model::Role::Hospital());

  registry_->Allocate(*tx, bank, unit_id, hospital);
  tx->Commit();

  LIFEBANK_LOG_INFO("blood allocated", {UintField("unit_id", unit_id), StringField("bank", bank), StringField("hospital", hospital)});
}

std::uint32_t HealthChain::ExpireBloodUnits(const model::Address& caller) {
  auto tx = repository_->Begin();
  RequireAdmin(*tx, caller);

  // a unit with an open transfer is settled by confirm/cancel first
  const auto expired = registry_->ExpireDue(*tx, [&](model::UnitId id) { return transfers_->FindPending(*tx, id).has_value(); });
  tx->Commit();

  if (expired > 0) {
    LIFEBANK_LOG_INFO("blood units expired", {UintField("count", expired)});
  }
  return expired;
}

// ------------------------------------------------------------
// Transfers
// ------------------------------------------------------------

std::string HealthChain::InitiateTransfer(const model::Address& initiator, model::UnitId unit_id) {
  auto tx = repository_->Begin();
  RequireInitialized(*tx);
  RequireRole(*tx, initiator, model::Role::BloodBank());

  auto event = transfers_->Initiate(*tx, initiator, unit_id);
  tx->Commit();

  LIFEBANK_LOG_INFO("custody transfer initiated", {StringField("event_id", event.event_id), UintField("unit_id", unit_id),
                                                   StringField("from", event.initiator), StringField("to", event.counterparty)});
  return event.event_id;
}

void HealthChain::ConfirmTransfer(const model::Address& confirmer, const std::string& event_id) {
  auto tx = repository_->Begin();
  RequireInitialized(*tx);
  RequireRole(*tx, confirmer, model::Role::Hospital());

  auto event = transfers_->Confirm(*tx, confirmer, event_id);
  tx->Commit();

  LIFEBANK_LOG_INFO("custody transfer confirmed",
                    {StringField("event_id", event_id), UintField("unit_id", event.unit_id), StringField("custodian", confirmer)});
}

void HealthChain::CancelTransfer(const model::Address& canceller, const std::string& event_id) {
  auto tx = repository_->Begin();
  RequireInitialized(*tx);

  auto event = transfers_->Cancel(*tx, canceller, event_id);
  tx->Commit();

  LIFEBANK_LOG_INFO("custody transfer cancelled", {StringField("event_id", event_id), UintField("unit_id", event.unit_id),
                                                   StringField("restored_status", model::ToString(event.prior_status))});
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

model::BloodUnit HealthChain::GetBloodUnit(model::UnitId unit_id) {
  auto tx   = repository_->Begin();
  auto unit = registry_->Load(*tx, unit_id);
  tx->Commit();
  return unit;
}

model::CustodyEvent HealthChain::GetCustodyEvent(const std::string& event_id) {
  auto tx    = repository_->Begin();
  auto event = transfers_->Load(*tx, event_id);
  tx->Commit();
  return event;
}

model::TrailMetadata HealthChain::GetCustodyTrailMetadata(model::UnitId unit_id) {
  auto tx = repository_->Begin();
  registry_->Load(*tx, unit_id);
  auto trail = transfers_->TrailFor(*tx, unit_id);
  tx->Commit();
  return trail;
}

std::vector<model::CustodyEvent> HealthChain::GetCustodyTrail(model::UnitId unit_id) {
  auto tx = repository_->Begin();
  registry_->Load(*tx, unit_id);
  auto events = transfers_->ConfirmedEvents(*tx, unit_id);
  tx->Commit();
  return events;
}

// ------------------------------------------------------------
// Try variants
// ------------------------------------------------------------

util::Status HealthChain::TryInitialize(const model::Address& admin) {
  return util::TryCall("HealthChain.Initialize", [&] { Initialize(admin); });
}

util::Status HealthChain::TryRegisterBloodBank(const model::Address& caller, const model::Address& bank) {
  return util::TryCall("HealthChain.RegisterBloodBank", [&] { RegisterBloodBank(caller, bank); });
}

util::Status HealthChain::TryRegisterHospital(const model::Address& caller, const model::Address& hospital) {
  return util::TryCall("HealthChain.RegisterHospital", [&] { RegisterHospital(caller, hospital); });
}

util::Outcome<model::UnitId> HealthChain::TryRegisterBlood(const model::Address& bank, model::BloodType type, std::uint32_t volume_ml,
                                                           model::Timestamp expiration, const std::optional<std::string>& donor_id) {
  return util::TryCallValue<model::UnitId>("HealthChain.RegisterBlood",
                                           [&] { return RegisterBlood(bank, type, volume_ml, expiration, donor_id); });
}

util::Status HealthChain::TryAllocateBlood(const model::Address& bank, model::UnitId unit_id, const model::Address& hospital) {
  return util::TryCall("HealthChain.AllocateBlood", [&] { AllocateBlood(bank, unit_id, hospital); });
}

util::Outcome<std::string> HealthChain::TryInitiateTransfer(const model::Address& initiator, model::UnitId unit_id) {
  return util::TryCallValue<std::string>("HealthChain.InitiateTransfer", [&] { return InitiateTransfer(initiator, unit_id); });
}

util::Status HealthChain::TryConfirmTransfer(const model::Address& confirmer, const std::string& event_id) {
  return util::TryCall("HealthChain.ConfirmTransfer", [&] { ConfirmTransfer(confirmer, event_id); });
}

util::Status HealthChain::TryCancelTransfer(const model::Address& canceller, const std::string& event_id) {
  return util::TryCall("HealthChain.CancelTransfer", [&] { CancelTransfer(canceller, event_id); });
}

util::Outcome<std::uint32_t> HealthChain::TryExpireBloodUnits(const model::Address& caller) {
  return util::TryCallValue<std::uint32_t>("HealthChain.ExpireBloodUnits", [&] { return ExpireBloodUnits(caller); });
}

util::Outcome<model::BloodUnit> HealthChain::TryGetBloodUnit(model::UnitId unit_id) {
  return util::TryCallValue<model::BloodUnit>("HealthChain.GetBloodUnit", [&] { return GetBloodUnit(unit_id); });
}

util::Outcome<model::CustodyEvent> HealthChain::TryGetCustodyEvent(const std::string& event_id) {
  return util::TryCallValue<model::CustodyEvent>("HealthChain.GetCustodyEvent", [&] { return GetCustodyEvent(event_id); });
}

util::Outcome<model::TrailMetadata> HealthChain::TryGetCustodyTrailMetadata(model::UnitId unit_id) {
  return util::TryCallValue<model::TrailMetadata>("HealthChain.GetCustodyTrailMetadata", [&] { return GetCustodyTrailMetadata(unit_id); });
}

util::Outcome<std::vector<model::CustodyEvent>> HealthChain::TryGetCustodyTrail(model::UnitId unit_id) {
  return util::TryCallValue<std::vector<model::CustodyEvent>>("HealthChain.GetCustodyTrail", [&] { return GetCustodyTrail(unit_id); });
}

} // namespace lifebank::core
