#pragma once

namespace lifebank::db::keys {

// Instance-tier keys. Each contract scope owns its own admin entry.
inline constexpr const char* kAccessControlAdmin = "access_control/admin";
inline constexpr const char* kHealthChainAdmin   = "health_chain/admin";
inline constexpr const char* kNextUnitId         = "health_chain/next_unit_id";

} // namespace lifebank::db::keys
