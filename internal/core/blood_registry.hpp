#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/custody_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/blood_unit.hpp"
#include "internal/util/time.hpp"

namespace lifebank::core {

/*
  Blood unit records. Units are never deleted; status and custodian are
  updated in place. All methods run inside the caller's transaction and
  throw before writing anything when a check fails.
*/
class BloodRegistry {
 public:
  BloodRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::LedgerClock> clock, CustodyPolicy policy);

  model::UnitId Register(db::Transaction& tx, const model::Address& bank, model::BloodType type, std::uint32_t volume_ml,
                         model::Timestamp expiration, const std::optional<std::string>& donor_id);

  model::BloodUnit Load(db::Transaction& tx, model::UnitId id);

  // Available -> Reserved for `hospital`; caller must be the owning bank.
  void Allocate(db::Transaction& tx, const model::Address& caller, model::UnitId id, const model::Address& hospital);

  // Persists a status change after checking it against the unit lattice.
  void Transition(db::Transaction& tx, model::BloodUnit& unit, model::BloodStatus to);

  // Marks overdue Available/Reserved units Expired, skipping units for which skip(id) is true.
  std::uint32_t ExpireDue(db::Transaction& tx, const std::function<bool(model::UnitId)>& skip);

  bool IsPastExpiration(const model::BloodUnit& unit) const;

 private:
  void          ValidateRegistration(std::uint32_t volume_ml, model::Timestamp expiration, const std::optional<std::string>& donor_id) const;
  model::UnitId NextUnitId(db::Transaction& tx);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<const util::LedgerClock> clock_;
  CustodyPolicy                            policy_;
};

bool IsValidSymbol(const std::string& text);

} // namespace lifebank::core
