#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace lifebank::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<std::string> GetInstanceValue(Transaction&, const std::string& key) override;
  Result PutInstanceValue(Transaction&, const std::string& key, const std::string& value) override;

  std::optional<std::vector<model::RoleGrant>> GetRoleGrants(Transaction&, const model::Address&) override;
  Result PutRoleGrants(Transaction&, const model::Address&, const std::vector<model::RoleGrant>&) override;
  Result DeleteRoleGrants(Transaction&, const model::Address&) override;

  Result InsertBloodUnit(Transaction&, const model::BloodUnit&) override;
  std::optional<model::BloodUnit> GetBloodUnit(Transaction&, model::UnitId) override;
  Result UpdateBloodUnit(Transaction&, const model::BloodUnit&) override;
  std::vector<model::BloodUnit> ListBloodUnits(Transaction&) override;

  Result InsertCustodyEvent(Transaction&, const model::CustodyEvent&) override;
  std::optional<model::CustodyEvent> GetCustodyEvent(Transaction&, const std::string&) override;
  Result UpdateCustodyEvent(Transaction&, const model::CustodyEvent&) override;
  std::vector<model::CustodyEvent> ListCustodyEvents(Transaction&, model::UnitId) override;

  std::optional<model::TrailMetadata> GetTrailMetadata(Transaction&, model::UnitId) override;
  Result UpsertTrailMetadata(Transaction&, const model::TrailMetadata&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    // instance tier
    std::unordered_map<std::string, std::string> instance;

    // persistent tier
    std::unordered_map<model::Address, std::vector<model::RoleGrant>> role_grants;
    std::unordered_map<model::UnitId, model::BloodUnit>               units;
    std::unordered_map<std::string, model::CustodyEvent>              events;
    std::unordered_map<model::UnitId, std::vector<std::string>>       unit_events;
    std::unordered_map<model::UnitId, model::TrailMetadata>           trails;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace lifebank::db::memory
