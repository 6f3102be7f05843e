#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace lifebank::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      // instance tier
      "CREATE TABLE IF NOT EXISTS instance_kv (key TEXT PRIMARY KEY, value TEXT NOT NULL);",

      // persistent tier
      "CREATE TABLE IF NOT EXISTS role_grants (address TEXT NOT NULL, position INTEGER NOT NULL, role_kind INTEGER NOT NULL, custom_id INTEGER NOT NULL, granted_at INTEGER NOT NULL, expires_at INTEGER, PRIMARY KEY (address, position));",
      "CREATE TABLE IF NOT EXISTS blood_units (id INTEGER PRIMARY KEY, blood_type INTEGER NOT NULL, volume_ml INTEGER NOT NULL, expiration INTEGER NOT NULL, status INTEGER NOT NULL, bank_id TEXT NOT NULL, donor_id TEXT, current_custodian TEXT NOT NULL, allocated_to TEXT, registered_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS custody_events (seq INTEGER PRIMARY KEY AUTOINCREMENT, event_id TEXT NOT NULL UNIQUE, unit_id INTEGER NOT NULL REFERENCES blood_units(id), status INTEGER NOT NULL, initiator TEXT NOT NULL, counterparty TEXT NOT NULL, created_at INTEGER NOT NULL, resolved_at INTEGER, prior_status INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS custody_events_by_unit ON custody_events (unit_id, seq);",
      "CREATE TABLE IF NOT EXISTS trail_metadata (unit_id INTEGER PRIMARY KEY REFERENCES blood_units(id), total_events INTEGER NOT NULL, last_confirmed_at INTEGER);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace lifebank::db::sqlite
