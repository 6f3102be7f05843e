#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace lifebank::db::sqlite {

using lifebank::db::ErrorCode;
using lifebank::db::Result;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColU64(st, col);
}

constexpr const char* kUnitColumns =
    "id,blood_type,volume_ml,expiration,status,bank_id,donor_id,current_custodian,allocated_to,registered_at";

model::BloodUnit ReadUnit(sqlite3_stmt* st) {
  model::BloodUnit u;
  u.id                = ColU64(st, 0);
  u.blood_type        = static_cast<model::BloodType>(ColI32(st, 1));
  u.volume_ml         = static_cast<uint32_t>(ColU64(st, 2));
  u.expiration        = ColU64(st, 3);
  u.status            = static_cast<model::BloodStatus>(ColI32(st, 4));
  u.bank_id           = ColText(st, 5);
  u.donor_id          = ColOptText(st, 6);
  u.current_custodian = ColText(st, 7);
  u.allocated_to      = ColOptText(st, 8);
  u.registered_at     = ColU64(st, 9);
  return u;
}

constexpr const char* kEventColumns = "event_id,unit_id,status,initiator,counterparty,created_at,resolved_at,prior_status";

model::CustodyEvent ReadEvent(sqlite3_stmt* st) {
  model::CustodyEvent e;
  e.event_id     = ColText(st, 0);
  e.unit_id      = ColU64(st, 1);
  e.status       = static_cast<model::CustodyStatus>(ColI32(st, 2));
  e.initiator    = ColText(st, 3);
  e.counterparty = ColText(st, 4);
  e.created_at   = ColU64(st, 5);
  e.resolved_at  = ColOptU64(st, 6);
  e.prior_status = static_cast<model::BloodStatus>(ColI32(st, 7));
  return e;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_CONSTRAINT_PRIMARYKEY:
    case SQLITE_CONSTRAINT_UNIQUE:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Instance tier
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetInstanceValue(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT value FROM instance_kv WHERE key=?;");
  BindText(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return std::nullopt;
  return ColText(st.get(), 0);
}

Result SqliteRepository::PutInstanceValue(Transaction& t, const std::string& key, const std::string& value) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO instance_kv(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
  BindText(st.get(), 1, key);
  BindText(st.get(), 2, value);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Role grants
// ------------------------------------------------------------------

std::optional<std::vector<model::RoleGrant>> SqliteRepository::GetRoleGrants(Transaction& t, const model::Address& address) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT role_kind,custom_id,granted_at,expires_at FROM role_grants "
                     "WHERE address=? ORDER BY position;");
  BindText(st.get(), 1, address);

  std::vector<model::RoleGrant> grants;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::RoleGrant g;
    g.role.kind      = static_cast<model::RoleKind>(ColI32(st.get(), 0));
    g.role.custom_id = static_cast<uint32_t>(ColU64(st.get(), 1));
    g.granted_at     = ColU64(st.get(), 2);
    g.expires_at     = ColOptU64(st.get(), 3);
    grants.push_back(g);
  }

  if (grants.empty()) return std::nullopt;
  return grants;
}

Result SqliteRepository::PutRoleGrants(Transaction& t, const model::Address& address, const std::vector<model::RoleGrant>& grants) {
  if (grants.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "empty role list for " + address);
  }

  auto* db = TX(t).Handle();

  auto del = Prepare(db, "DELETE FROM role_grants WHERE address=?;");
  BindText(del.get(), 1, address);
  if (auto r = Translate(db, sqlite3_step(del.get())); !r) return r;

  auto ins = Prepare(db,
                     "INSERT INTO role_grants(address,position,role_kind,custom_id,granted_at,expires_at) "
                     "VALUES(?,?,?,?,?,?);");
  for (std::size_t i = 0; i < grants.size(); ++i) {
    const auto& g = grants[i];
    sqlite3_reset(ins.get());
    sqlite3_clear_bindings(ins.get());
    BindText(ins.get(), 1, address);
    BindU64(ins.get(), 2, i);
    BindI32(ins.get(), 3, static_cast<int>(g.role.kind));
    BindU64(ins.get(), 4, g.role.custom_id);
    BindU64(ins.get(), 5, g.granted_at);
    BindOptU64(ins.get(), 6, g.expires_at);
    if (auto r = Translate(db, sqlite3_step(ins.get())); !r) return r;
  }
  return Result::Ok();
}

Result SqliteRepository::DeleteRoleGrants(Transaction& t, const model::Address& address) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM role_grants WHERE address=?;");
  BindText(st.get(), 1, address);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Blood units
// ------------------------------------------------------------------

Result SqliteRepository::InsertBloodUnit(Transaction& t, const model::BloodUnit& u) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO blood_units(id,blood_type,volume_ml,expiration,status,bank_id,donor_id,"
                     "current_custodian,allocated_to,registered_at) VALUES(?,?,?,?,?,?,?,?,?,?);");
  BindU64(st.get(), 1, u.id);
  BindI32(st.get(), 2, static_cast<int>(u.blood_type));
  BindU64(st.get(), 3, u.volume_ml);
  BindU64(st.get(), 4, u.expiration);
  BindI32(st.get(), 5, static_cast<int>(u.status));
  BindText(st.get(), 6, u.bank_id);
  BindOptText(st.get(), 7, u.donor_id);
  BindText(st.get(), 8, u.current_custodian);
  BindOptText(st.get(), 9, u.allocated_to);
  BindU64(st.get(), 10, u.registered_at);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BloodUnit> SqliteRepository::GetBloodUnit(Transaction& t, model::UnitId id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kUnitColumns + " FROM blood_units WHERE id=?;";
  auto              st  = Prepare(db, sql.c_str());
  BindU64(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadUnit(st.get());
}

Result SqliteRepository::UpdateBloodUnit(Transaction& t, const model::BloodUnit& u) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE blood_units SET blood_type=?,volume_ml=?,expiration=?,status=?,bank_id=?,donor_id=?,"
                     "current_custodian=?,allocated_to=?,registered_at=? WHERE id=?;");
  BindI32(st.get(), 1, static_cast<int>(u.blood_type));
  BindU64(st.get(), 2, u.volume_ml);
  BindU64(st.get(), 3, u.expiration);
  BindI32(st.get(), 4, static_cast<int>(u.status));
  BindText(st.get(), 5, u.bank_id);
  BindOptText(st.get(), 6, u.donor_id);
  BindText(st.get(), 7, u.current_custodian);
  BindOptText(st.get(), 8, u.allocated_to);
  BindU64(st.get(), 9, u.registered_at);
  BindU64(st.get(), 10, u.id);

  auto r = Translate(db, sqlite3_step(st.get()));
  if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return r;
}

std::vector<model::BloodUnit> SqliteRepository::ListBloodUnits(Transaction& t) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kUnitColumns + " FROM blood_units ORDER BY id;";
  auto              st  = Prepare(db, sql.c_str());

  std::vector<model::BloodUnit> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadUnit(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Custody events
// ------------------------------------------------------------------

Result SqliteRepository::InsertCustodyEvent(Transaction& t, const model::CustodyEvent& e) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO custody_events(event_id,unit_id,status,initiator,counterparty,created_at,"
                     "resolved_at,prior_status) VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, e.event_id);
  BindU64(st.get(), 2, e.unit_id);
  BindI32(st.get(), 3, static_cast<int>(e.status));
  BindText(st.get(), 4, e.initiator);
  BindText(st.get(), 5, e.counterparty);
  BindU64(st.get(), 6, e.created_at);
  BindOptU64(st.get(), 7, e.resolved_at);
  BindI32(st.get(), 8, static_cast<int>(e.prior_status));
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CustodyEvent> SqliteRepository::GetCustodyEvent(Transaction& t, const std::string& event_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kEventColumns + " FROM custody_events WHERE event_id=?;";
  auto              st  = Prepare(db, sql.c_str());
  BindText(st.get(), 1, event_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadEvent(st.get());
}

Result SqliteRepository::UpdateCustodyEvent(Transaction& t, const model::CustodyEvent& e) {
  auto* db = TX(t).Handle();

  // unit_id is part of the match so a mismatched update is rejected, not applied
  auto st = Prepare(db,
                    "UPDATE custody_events SET status=?,initiator=?,counterparty=?,created_at=?,resolved_at=?,"
                    "prior_status=? WHERE event_id=? AND unit_id=?;");
  BindI32(st.get(), 1, static_cast<int>(e.status));
  BindText(st.get(), 2, e.initiator);
  BindText(st.get(), 3, e.counterparty);
  BindU64(st.get(), 4, e.created_at);
  BindOptU64(st.get(), 5, e.resolved_at);
  BindI32(st.get(), 6, static_cast<int>(e.prior_status));
  BindText(st.get(), 7, e.event_id);
  BindU64(st.get(), 8, e.unit_id);

  auto r = Translate(db, sqlite3_step(st.get()));
  if (!r || sqlite3_changes(db) > 0) return r;

  auto probe = Prepare(db, "SELECT 1 FROM custody_events WHERE event_id=?;");
  BindText(probe.get(), 1, e.event_id);
  if (sqlite3_step(probe.get()) == SQLITE_ROW) {
    return Result::Err(ErrorCode::ConstraintViolation, "custody event unit id is immutable");
  }
  return Result::Err(ErrorCode::NotFound);
}

std::vector<model::CustodyEvent> SqliteRepository::ListCustodyEvents(Transaction& t, model::UnitId unit_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kEventColumns + " FROM custody_events WHERE unit_id=? ORDER BY seq;";
  auto              st  = Prepare(db, sql.c_str());
  BindU64(st.get(), 1, unit_id);

  std::vector<model::CustodyEvent> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadEvent(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Trail metadata
// ------------------------------------------------------------------

std::optional<model::TrailMetadata> SqliteRepository::GetTrailMetadata(Transaction& t, model::UnitId unit_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT unit_id,total_events,last_confirmed_at FROM trail_metadata WHERE unit_id=?;");
  BindU64(st.get(), 1, unit_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::TrailMetadata m;
  m.unit_id           = ColU64(st.get(), 0);
  m.total_events      = ColU64(st.get(), 1);
  m.last_confirmed_at = ColOptU64(st.get(), 2);
  return m;
}

Result SqliteRepository::UpsertTrailMetadata(Transaction& t, const model::TrailMetadata& m) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO trail_metadata(unit_id,total_events,last_confirmed_at) VALUES(?,?,?) "
                     "ON CONFLICT(unit_id) DO UPDATE SET total_events=excluded.total_events, "
                     "last_confirmed_at=excluded.last_confirmed_at;");
  BindU64(st.get(), 1, m.unit_id);
  BindU64(st.get(), 2, m.total_events);
  BindOptU64(st.get(), 3, m.last_confirmed_at);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace lifebank::db::sqlite
