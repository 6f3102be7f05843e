#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace lifebank::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace lifebank::db::sqlite
