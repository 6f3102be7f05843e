#include "blood_registry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/db/api/instance_keys.hpp"
#include "internal/db/api/result_check.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace lifebank::core {

namespace {

constexpr std::size_t kMaxSymbolLength = 32;

} // namespace

bool IsValidSymbol(const std::string& text) {
  if (text.empty() || text.size() > kMaxSymbolLength) {
    return false;
  }
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

BloodRegistry::BloodRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::LedgerClock> clock, CustodyPolicy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), policy_(policy) {
}

bool BloodRegistry::IsPastExpiration(const model::BloodUnit& unit) const {
  return clock_->Now() >= unit.expiration;
}

void BloodRegistry::ValidateRegistration(std::uint32_t volume_ml, model::Timestamp expiration,
                                         const std::optional<std::string>& donor_id) const {
  if (volume_ml < policy_.min_volume_ml || volume_ml > policy_.max_volume_ml) {
    throw util::InvalidInput("register blood: volume " + std::to_string(volume_ml) + "ml outside [" + std::to_string(policy_.min_volume_ml) +
                             ", " + std::to_string(policy_.max_volume_ml) + "]");
  }

  const auto now = clock_->Now();
  if (expiration <= now) {
    throw util::InvalidInput("register blood: expiration must be in the future");
  }
  if (expiration - now > policy_.max_shelf_life_seconds) {
    throw util::InvalidInput("register blood: expiration exceeds maximum shelf life");
  }

  if (donor_id.has_value() && !IsValidSymbol(*donor_id)) {
    throw util::InvalidInput("register blood: donor id must be 1-32 characters of [A-Za-z0-9_]");
  }
}

model::UnitId BloodRegistry::NextUnitId(db::Transaction& tx) {
  auto stored = repository_->GetInstanceValue(tx, db::keys::kNextUnitId);
  if (!stored.has_value()) {
    return 1;
  }
  try {
    return std::stoull(*stored);
  } catch (const std::exception&) {
    throw std::runtime_error("corrupt unit id counter: '" + *stored + "'");
  }
}

model::UnitId BloodRegistry::Register(db::Transaction& tx, const model::Address& bank, model::BloodType type, std::uint32_t volume_ml,
                                      model::Timestamp expiration, const std::optional<std::string>& donor_id) {
  ValidateRegistration(volume_ml, expiration, donor_id);

  model::BloodUnit unit;
  unit.id                = NextUnitId(tx);
  unit.blood_type        = type;
  unit.volume_ml         = volume_ml;
  unit.expiration        = expiration;
  unit.status            = model::BloodStatus::kAvailable;
  unit.bank_id           = bank;
  unit.donor_id          = donor_id;
  unit.current_custodian = bank;
  unit.registered_at     = clock_->Now();

  db::ThrowIfDbError(repository_->InsertBloodUnit(tx, unit), "register blood");
  db::ThrowIfDbError(repository_->PutInstanceValue(tx, db::keys::kNextUnitId, std::to_string(unit.id + 1)), "advance unit id");
  return unit.id;
}

model::BloodUnit BloodRegistry::Load(db::Transaction& tx, model::UnitId id) {
  auto unit = repository_->GetBloodUnit(tx, id);
  if (!unit.has_value()) {
    throw util::NotFound("blood unit " + std::to_string(id) + " not found");
  }
  return *unit;
}

void BloodRegistry::Allocate(db::Transaction& tx, const model::Address& caller, model::UnitId id, const model::Address& hospital) {
  auto unit = Load(tx, id);
  if (unit.bank_id != caller) {
    throw util::Unauthorized("allocate blood: unit " + std::to_string(id) + " belongs to another bank");
  }
  if (unit.status != model::BloodStatus::kAvailable) {
    throw util::InvalidState("allocate blood: unit is " + std::string(model::ToString(unit.status)) + ", not available");
  }
  if (IsPastExpiration(unit)) {
    throw util::InvalidState("allocate blood: unit has expired");
  }

  unit.allocated_to = hospital;
  Transition(tx, unit, model::BloodStatus::kReserved);
}

void BloodRegistry::Transition(db::Transaction& tx, model::BloodUnit& unit, model::BloodStatus to) {
  if (!model::CanTransition(unit.status, to)) {
    throw util::InvalidState("blood unit " + std::to_string(unit.id) + ": illegal transition " + std::string(model::ToString(unit.status)) +
                             " -> " + std::string(model::ToString(to)));
  }
  unit.status = to;
  db::ThrowIfDbError(repository_->UpdateBloodUnit(tx, unit), "update blood unit");
}

std::uint32_t BloodRegistry::ExpireDue(db::Transaction& tx, const std::function<bool(model::UnitId)>& skip) {
  std::uint32_t expired = 0;
  for (auto& unit : repository_->ListBloodUnits(tx)) {
    if (model::IsTerminal(unit.status) || !IsPastExpiration(unit) || skip(unit.id)) {
      continue;
    }
    Transition(tx, unit, model::BloodStatus::kExpired);
    ++expired;
  }
  return expired;
}

} // namespace lifebank::core
