#pragma once

#include "sqlite_db.hpp"

namespace lifebank::db::sqlite {

// Creates the ledger tables if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace lifebank::db::sqlite
