#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/blood_unit.hpp"
#include "internal/model/custody_event.hpp"
#include "internal/model/role.hpp"

namespace lifebank::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A transaction that is not committed leaves no trace

  Storage is split in two tiers that never share a namespace:

    instance tier    contract-scoped singletons (admins, id counters),
                     addressed by string key
    persistent tier  per-entity records (role grants, blood units,
                     custody events, trail metadata)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Instance tier
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetInstanceValue(Transaction&, const std::string& key) = 0;

  virtual Result PutInstanceValue(Transaction&, const std::string& key, const std::string& value) = 0;

  // ---------------------------------------------------------------------
  // Role grants (one sorted list per address)
  // ---------------------------------------------------------------------

  // nullopt when the address has no record at all.
  virtual std::optional<std::vector<model::RoleGrant>> GetRoleGrants(Transaction&, const model::Address& address) = 0;

  virtual Result PutRoleGrants(Transaction&, const model::Address& address, const std::vector<model::RoleGrant>& grants) = 0;

  virtual Result DeleteRoleGrants(Transaction&, const model::Address& address) = 0;

  // ---------------------------------------------------------------------
  // Blood units
  // ---------------------------------------------------------------------

  virtual Result InsertBloodUnit(Transaction&, const model::BloodUnit&) = 0;

  virtual std::optional<model::BloodUnit> GetBloodUnit(Transaction&, model::UnitId id) = 0;

  virtual Result UpdateBloodUnit(Transaction&, const model::BloodUnit&) = 0;

  // Ordered by id.
  virtual std::vector<model::BloodUnit> ListBloodUnits(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Custody events
  // ---------------------------------------------------------------------

  virtual Result InsertCustodyEvent(Transaction&, const model::CustodyEvent&) = 0;

  virtual std::optional<model::CustodyEvent> GetCustodyEvent(Transaction&, const std::string& event_id) = 0;

  virtual Result UpdateCustodyEvent(Transaction&, const model::CustodyEvent&) = 0;

  // All events of a unit in insertion order.
  virtual std::vector<model::CustodyEvent> ListCustodyEvents(Transaction&, model::UnitId unit_id) = 0;

  // ---------------------------------------------------------------------
  // Trail metadata
  // ---------------------------------------------------------------------

  virtual std::optional<model::TrailMetadata> GetTrailMetadata(Transaction&, model::UnitId unit_id) = 0;

  virtual Result UpsertTrailMetadata(Transaction&, const model::TrailMetadata&) = 0;
};

} // namespace lifebank::db
