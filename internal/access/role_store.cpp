#include "role_store.hpp"

#include "internal/access/role_grants.hpp"
#include "internal/db/api/instance_keys.hpp"
#include "internal/db/api/result_check.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/try_call.hpp"

namespace lifebank::access {

using lifebank::observability::StringField;
using lifebank::observability::UintField;

RoleStore::RoleStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::LedgerClock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void RoleStore::Initialize(const model::Address& admin) {
  auto tx = repository_->Begin();
  if (repository_->GetInstanceValue(*tx, db::keys::kAccessControlAdmin).has_value()) {
    throw util::AlreadyInitialized("initialize role store: admin already set");
  }
  db::ThrowIfDbError(repository_->PutInstanceValue(*tx, db::keys::kAccessControlAdmin, admin), "initialize role store");
  tx->Commit();

  LIFEBANK_LOG_INFO("role store initialized", {StringField("admin", admin)});
}

void RoleStore::RequireAdmin(db::Transaction& tx, const model::Address& caller) {
  auto admin = repository_->GetInstanceValue(tx, db::keys::kAccessControlAdmin);
  if (!admin.has_value()) {
    throw util::NotInitialized("role store is not initialized");
  }
  if (*admin != caller) {
    throw util::Unauthorized("caller " + caller + " is not the role store admin");
  }
}

void RoleStore::Store(db::Transaction& tx, const model::Address& address, const std::vector<model::RoleGrant>& grants) {
  // an empty list is never persisted; the record goes away instead
  if (grants.empty()) {
    db::ThrowIfDbError(repository_->DeleteRoleGrants(tx, address), "delete role grants");
    return;
  }
  db::ThrowIfDbError(repository_->PutRoleGrants(tx, address, grants), "store role grants");
}

// ------------------------------------------------------------
// Transaction-scoped operations
// ------------------------------------------------------------

std::uint32_t RoleStore::SweepExpiredInTx(db::Transaction& tx, const model::Address& address) {
  auto grants = repository_->GetRoleGrants(tx, address);
  if (!grants.has_value()) {
    return 0;
  }

  const auto removed = RemoveExpired(*grants, clock_->Now());
  if (removed > 0) {
    Store(tx, address, *grants);
  }
  return removed;
}

void RoleStore::GrantInTx(db::Transaction& tx, const model::Address& address, const model::Role& role,
                          std::optional<model::Timestamp> expires_at) {
  SweepExpiredInTx(tx, address);

  auto grants = repository_->GetRoleGrants(tx, address).value_or(std::vector<model::RoleGrant>{});
  RemoveRole(grants, role);
  InsertSorted(grants, model::RoleGrant{role, clock_->Now(), expires_at});
  Store(tx, address, grants);
}

bool RoleStore::HasRoleInTx(db::Transaction& tx, const model::Address& address, const model::Role& role) {
  SweepExpiredInTx(tx, address);

  auto grants = repository_->GetRoleGrants(tx, address);
  return grants.has_value() && ContainsRole(*grants, role);
}

// ------------------------------------------------------------
// Public operations
// ------------------------------------------------------------

void RoleStore::GrantRoleWithExpiry(const model::Address& caller, const model::Address& address, const model::Role& role,
                                    std::optional<model::Timestamp> expires_at) {
  auto tx = repository_->Begin();
  RequireAdmin(*tx, caller);
  GrantInTx(*tx, address, role, expires_at);
  tx->Commit();

  LIFEBANK_LOG_INFO("role granted", {StringField("address", address), StringField("role", model::ToString(role)),
                                     StringField("expires_at", expires_at ? std::to_string(*expires_at) : "never")});
}

void RoleStore::RevokeRole(const model::Address& caller, const model::Address& address, const model::Role& role) {
  auto tx = repository_->Begin();
  RequireAdmin(*tx, caller);

  auto grants = repository_->GetRoleGrants(*tx, address);
  if (!grants.has_value() || !RemoveRole(*grants, role)) {
    // revoking an absent role is a no-op
    return;
  }
  Store(*tx, address, *grants);
  tx->Commit();

  LIFEBANK_LOG_INFO("role revoked", {StringField("address", address), StringField("role", model::ToString(role))});
}

bool RoleStore::HasRole(const model::Address& address, const model::Role& role) {
  auto tx     = repository_->Begin();
  bool result = HasRoleInTx(*tx, address, role);
  tx->Commit();
  return result;
}

std::vector<model::RoleGrant> RoleStore::GetRoles(const model::Address& address) {
  auto tx     = repository_->Begin();
  auto grants = repository_->GetRoleGrants(*tx, address);
  tx->Commit();
  return grants.value_or(std::vector<model::RoleGrant>{});
}

std::uint32_t RoleStore::CleanupExpiredRoles(const model::Address& caller, const model::Address& address) {
  auto tx = repository_->Begin();
  RequireAdmin(*tx, caller);
  const auto removed = SweepExpiredInTx(*tx, address);
  tx->Commit();

  if (removed > 0) {
    LIFEBANK_LOG_INFO("expired roles removed", {StringField("address", address), UintField("count", removed)});
  }
  return removed;
}

// ------------------------------------------------------------
// Try variants
// ------------------------------------------------------------

util::Status RoleStore::TryInitialize(const model::Address& admin) {
  return util::TryCall("RoleStore.Initialize", [&] { Initialize(admin); });
}

util::Status RoleStore::TryGrantRoleWithExpiry(const model::Address& caller, const model::Address& address, const model::Role& role,
                                               std::optional<model::Timestamp> expires_at) {
  return util::TryCall("RoleStore.GrantRoleWithExpiry", [&] { GrantRoleWithExpiry(caller, address, role, expires_at); });
}

util::Status RoleStore::TryRevokeRole(const model::Address& caller, const model::Address& address, const model::Role& role) {
  return util::TryCall("RoleStore.RevokeRole", [&] { RevokeRole(caller, address, role); });
}

util::Outcome<std::uint32_t> RoleStore::TryCleanupExpiredRoles(const model::Address& caller, const model::Address& address) {
  return util::TryCallValue<std::uint32_t>("RoleStore.CleanupExpiredRoles", [&] { return CleanupExpiredRoles(caller, address); });
}

} // namespace lifebank::access
