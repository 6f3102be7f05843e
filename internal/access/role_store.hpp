#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/role.hpp"
#include "internal/util/status.hpp"
#include "internal/util/time.hpp"

namespace lifebank::access {

/*
  Role store: time-limited role grants per address.

  Public operations each run in their own repository transaction. The
  *InTx variants run inside a caller's transaction so the health chain can
  register actors and check roles atomically with its own writes.

  HasRole is a mutating read: it sweeps and persists expired grants before
  answering. GetRoles never sweeps and may return expired grants.
*/
class RoleStore {
 public:
  RoleStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::LedgerClock> clock);

  void Initialize(const model::Address& admin);

  void GrantRoleWithExpiry(const model::Address& caller, const model::Address& address, const model::Role& role,
                           std::optional<model::Timestamp> expires_at);
  void RevokeRole(const model::Address& caller, const model::Address& address, const model::Role& role);

  bool                          HasRole(const model::Address& address, const model::Role& role);
  std::vector<model::RoleGrant> GetRoles(const model::Address& address);

  std::uint32_t CleanupExpiredRoles(const model::Address& caller, const model::Address& address);

  util::Status                 TryInitialize(const model::Address& admin);
  util::Status                 TryGrantRoleWithExpiry(const model::Address& caller, const model::Address& address, const model::Role& role,
                                                      std::optional<model::Timestamp> expires_at);
  util::Status                 TryRevokeRole(const model::Address& caller, const model::Address& address, const model::Role& role);
  util::Outcome<std::uint32_t> TryCleanupExpiredRoles(const model::Address& caller, const model::Address& address);

  // Transaction-scoped building blocks; no admin check.
  void          GrantInTx(db::Transaction& tx, const model::Address& address, const model::Role& role,
                          std::optional<model::Timestamp> expires_at);
  bool          HasRoleInTx(db::Transaction& tx, const model::Address& address, const model::Role& role);
  std::uint32_t SweepExpiredInTx(db::Transaction& tx, const model::Address& address);

 private:
  void RequireAdmin(db::Transaction& tx, const model::Address& caller);
  void Store(db::Transaction& tx, const model::Address& address, const std::vector<model::RoleGrant>& grants);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<const util::LedgerClock> clock_;
};

} // namespace lifebank::access
