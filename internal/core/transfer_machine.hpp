#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/blood_registry.hpp"
#include "internal/core/custody_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/custody_event.hpp"
#include "internal/util/time.hpp"

namespace lifebank::core {

/*
  Custody transfer state machine.

    Pending -> Confirmed | Cancelled

  At most one Pending event exists per unit; Initiate checks the stored
  events, not a cached flag. Confirm and Cancel validate every precondition
  before their first write, so a rejected call changes nothing even before
  the surrounding transaction rolls back.

  Trail metadata is written by Confirm only.
*/
class TransferMachine {
 public:
  TransferMachine(std::shared_ptr<db::Repository> repository, std::shared_ptr<BloodRegistry> registry,
                  std::shared_ptr<const util::LedgerClock> clock, CustodyPolicy policy);

  model::CustodyEvent Initiate(db::Transaction& tx, const model::Address& initiator, model::UnitId unit_id);
  model::CustodyEvent Confirm(db::Transaction& tx, const model::Address& confirmer, const std::string& event_id);
  model::CustodyEvent Cancel(db::Transaction& tx, const model::Address& canceller, const std::string& event_id);

  model::CustodyEvent                Load(db::Transaction& tx, const std::string& event_id);
  std::optional<model::CustodyEvent> FindPending(db::Transaction& tx, model::UnitId unit_id);

  // {unit_id, 0} until the first confirmation.
  model::TrailMetadata             TrailFor(db::Transaction& tx, model::UnitId unit_id);
  std::vector<model::CustodyEvent> ConfirmedEvents(db::Transaction& tx, model::UnitId unit_id);

 private:
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<BloodRegistry>           registry_;
  std::shared_ptr<const util::LedgerClock> clock_;
  CustodyPolicy                            policy_;
};

} // namespace lifebank::core
