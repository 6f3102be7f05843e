#include "role_grants.hpp"

#include <algorithm>

namespace lifebank::access {

bool IsExpired(const model::RoleGrant& grant, model::Timestamp now) {
  return grant.expires_at.has_value() && now >= *grant.expires_at;
}

std::uint32_t RemoveExpired(std::vector<model::RoleGrant>& grants, model::Timestamp now) {
  const auto before = grants.size();
  grants.erase(std::remove_if(grants.begin(), grants.end(), [now](const auto& g) { return IsExpired(g, now); }), grants.end());
  return static_cast<std::uint32_t>(before - grants.size());
}

bool RemoveRole(std::vector<model::RoleGrant>& grants, const model::Role& role) {
  const auto before = grants.size();
  grants.erase(std::remove_if(grants.begin(), grants.end(), [&role](const auto& g) { return g.role == role; }), grants.end());
  return grants.size() != before;
}

void InsertSorted(std::vector<model::RoleGrant>& grants, model::RoleGrant grant) {
  auto pos = std::find_if(grants.begin(), grants.end(),
                          [&grant](const auto& existing) { return model::CompareRoles(grant.role, existing.role) < 0; });
  grants.insert(pos, std::move(grant));
}

bool ContainsRole(const std::vector<model::RoleGrant>& grants, const model::Role& role) {
  return std::any_of(grants.begin(), grants.end(), [&role](const auto& g) { return g.role == role; });
}

} // namespace lifebank::access
