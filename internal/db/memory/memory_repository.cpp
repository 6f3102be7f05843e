#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace lifebank::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Instance tier
// ------------------------------------------------------------------

std::optional<std::string> MemoryRepository::GetInstanceValue(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  const auto  it = s.instance.find(key);
  if (it == s.instance.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::PutInstanceValue(Transaction& t, const std::string& key, const std::string& value) {
  TX(t).Mutable().instance[key] = value;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Role grants
// ------------------------------------------------------------------

std::optional<std::vector<model::RoleGrant>> MemoryRepository::GetRoleGrants(Transaction& t, const model::Address& address) {
  const auto& s  = TX(t).View();
  const auto  it = s.role_grants.find(address);
  if (it == s.role_grants.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::PutRoleGrants(Transaction& t, const model::Address& address, const std::vector<model::RoleGrant>& grants) {
  if (grants.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "empty role list for " + address);
  }
  TX(t).Mutable().role_grants[address] = grants;
  return Result::Ok();
}

Result MemoryRepository::DeleteRoleGrants(Transaction& t, const model::Address& address) {
  TX(t).Mutable().role_grants.erase(address);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Blood units
// ------------------------------------------------------------------

Result MemoryRepository::InsertBloodUnit(Transaction& t, const model::BloodUnit& unit) {
  auto& s = TX(t).Mutable();
  if (s.units.contains(unit.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.units[unit.id] = unit;
  return Result::Ok();
}

std::optional<model::BloodUnit> MemoryRepository::GetBloodUnit(Transaction& t, model::UnitId id) {
  const auto& s  = TX(t).View();
  const auto  it = s.units.find(id);
  if (it == s.units.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateBloodUnit(Transaction& t, const model::BloodUnit& unit) {
  auto& s = TX(t).Mutable();
  if (!s.units.contains(unit.id)) return Result::Err(ErrorCode::NotFound);
  s.units[unit.id] = unit;
  return Result::Ok();
}

std::vector<model::BloodUnit> MemoryRepository::ListBloodUnits(Transaction& t) {
  const auto&                   s = TX(t).View();
  std::vector<model::BloodUnit> units;
  units.reserve(s.units.size());
  for (const auto& [_, unit] : s.units) {
    units.push_back(unit);
  }
  std::sort(units.begin(), units.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return units;
}

// ------------------------------------------------------------------
// Custody events
// ------------------------------------------------------------------

Result MemoryRepository::InsertCustodyEvent(Transaction& t, const model::CustodyEvent& event) {
  auto& s = TX(t).Mutable();
  if (s.events.contains(event.event_id)) return Result::Err(ErrorCode::AlreadyExists);
  s.events[event.event_id] = event;
  s.unit_events[event.unit_id].push_back(event.event_id);
  return Result::Ok();
}

std::optional<model::CustodyEvent> MemoryRepository::GetCustodyEvent(Transaction& t, const std::string& event_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.events.find(event_id);
  if (it == s.events.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateCustodyEvent(Transaction& t, const model::CustodyEvent& event) {
  auto& s  = TX(t).Mutable();
  auto  it = s.events.find(event.event_id);
  if (it == s.events.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.unit_id != event.unit_id) {
    return Result::Err(ErrorCode::ConstraintViolation, "custody event unit id is immutable");
  }
  it->second = event;
  return Result::Ok();
}

std::vector<model::CustodyEvent> MemoryRepository::ListCustodyEvents(Transaction& t, model::UnitId unit_id) {
  const auto&                      s = TX(t).View();
  std::vector<model::CustodyEvent> out;

  const auto ids = s.unit_events.find(unit_id);
  if (ids == s.unit_events.end()) return out;

  out.reserve(ids->second.size());
  for (const auto& id : ids->second) {
    out.push_back(s.events.at(id));
  }
  return out;
}

// ------------------------------------------------------------------
// Trail metadata
// ------------------------------------------------------------------

std::optional<model::TrailMetadata> MemoryRepository::GetTrailMetadata(Transaction& t, model::UnitId unit_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.trails.find(unit_id);
  if (it == s.trails.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertTrailMetadata(Transaction& t, const model::TrailMetadata& trail) {
  TX(t).Mutable().trails[trail.unit_id] = trail;
  return Result::Ok();
}

} // namespace lifebank::db::memory
