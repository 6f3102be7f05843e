#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/access/role_store.hpp"
#include "internal/core/blood_registry.hpp"
#include "internal/core/custody_policy.hpp"
#include "internal/core/transfer_machine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/blood_unit.hpp"
#include "internal/model/custody_event.hpp"
#include "internal/util/status.hpp"
#include "internal/util/time.hpp"

namespace lifebank::core {

/*
  HealthChain is the custody surface.

  Every public operation runs in exactly one repository transaction:

    - open transaction
    - check initialization and roles
    - validate and mutate through the registry / transfer machine
    - commit

  Any throw leaves the transaction uncommitted and it rolls back on scope
  exit, including role sweeps done while checking the caller.

  Try* variants report failures as util::Status instead of throwing, except
  NotInitialized, which is always thrown.
*/
class HealthChain {
 public:
  HealthChain(std::shared_ptr<db::Repository> repository, std::shared_ptr<access::RoleStore> roles,
              std::shared_ptr<const util::LedgerClock> clock, CustodyPolicy policy);

  void Initialize(const model::Address& admin);

  void RegisterBloodBank(const model::Address& caller, const model::Address& bank);
  void RegisterHospital(const model::Address& caller, const model::Address& hospital);

  model::UnitId RegisterBlood(const model::Address& bank, model::BloodType type, std::uint32_t volume_ml, model::Timestamp expiration,
                              const std::optional<std::string>& donor_id);
  void          AllocateBlood(const model::Address& bank, model::UnitId unit_id, const model::Address& hospital);

  std::string InitiateTransfer(const model::Address& initiator, model::UnitId unit_id);
  void        ConfirmTransfer(const model::Address& confirmer, const std::string& event_id);
  void        CancelTransfer(const model::Address& canceller, const std::string& event_id);

  std::uint32_t ExpireBloodUnits(const model::Address& caller);

  model::BloodUnit                 GetBloodUnit(model::UnitId unit_id);
  model::CustodyEvent              GetCustodyEvent(const std::string& event_id);
  model::TrailMetadata             GetCustodyTrailMetadata(model::UnitId unit_id);
  std::vector<model::CustodyEvent> GetCustodyTrail(model::UnitId unit_id);

  util::Status                 TryInitialize(const model::Address& admin);
  util::Status                 TryRegisterBloodBank(const model::Address& caller, const model::Address& bank);
  util::Status                 TryRegisterHospital(const model::Address& caller, const model::Address& hospital);
  util::Outcome<model::UnitId> TryRegisterBlood(const model::Address& bank, model::BloodType type, std::uint32_t volume_ml,
                                                model::Timestamp expiration, const std::optional<std::string>& donor_id);
  util::Status                 TryAllocateBlood(const model::Address& bank, model::UnitId unit_id, const model::Address& hospital);
  util::Outcome<std::string>   TryInitiateTransfer(const model::Address& initiator, model::UnitId unit_id);
  util::Status                 TryConfirmTransfer(const model::Address& confirmer, const std::string& event_id);
  util::Status                 TryCancelTransfer(const model::Address& canceller, const std::string& event_id);
  util::Outcome<std::uint32_t> TryExpireBloodUnits(const model::Address& caller);

  util::Outcome<model::BloodUnit>                 TryGetBloodUnit(model::UnitId unit_id);
  util::Outcome<model::CustodyEvent>              TryGetCustodyEvent(const std::string& event_id);
  util::Outcome<model::TrailMetadata>             TryGetCustodyTrailMetadata(model::UnitId unit_id);
  util::Outcome<std::vector<model::CustodyEvent>> TryGetCustodyTrail(model::UnitId unit_id);

 private:
  model::Address RequireInitialized(db::Transaction& tx);
  void           RequireAdmin(db::Transaction& tx, const model::Address& caller);
  void           RequireRole(db::Transaction& tx, const model::Address& address, const model::Role& role);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<access::RoleStore>       roles_;
  std::shared_ptr<const util::LedgerClock> clock_;
  std::shared_ptr<BloodRegistry>           registry_;
  std::unique_ptr<TransferMachine>         transfers_;
};

} // namespace lifebank::core
