#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/role.hpp"

namespace lifebank::access {

/*
  Pure operations on a per-address grant list. The list is kept sorted by
  role (CompareRoles) and holds at most one grant per role.
*/

// expires_at set and now >= expires_at
bool IsExpired(const model::RoleGrant& grant, model::Timestamp now);

// Single order-preserving pass; returns the number of grants dropped.
std::uint32_t RemoveExpired(std::vector<model::RoleGrant>& grants, model::Timestamp now);

// Returns true if a grant for `role` was present.
bool RemoveRole(std::vector<model::RoleGrant>& grants, const model::Role& role);

// Inserts before the first grant whose role compares greater.
void InsertSorted(std::vector<model::RoleGrant>& grants, model::RoleGrant grant);

bool ContainsRole(const std::vector<model::RoleGrant>& grants, const model::Role& role);

} // namespace lifebank::access
