#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"

namespace lifebank::factory {

using lifebank::observability::StringField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const lifebank::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    LIFEBANK_LOG_INFO("sqlite repository opened", {StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

core::CustodyPolicy PolicyFromConfig(const lifebank::runtime::config::RuntimeConfig& config) {
  core::CustodyPolicy policy;
  if (!config.has_custody()) {
    return policy;
  }

  const auto& custody = config.custody();
  if (custody.cancel_cooldown_seconds() != 0) policy.cancel_cooldown_seconds = custody.cancel_cooldown_seconds();
  if (custody.min_volume_ml() != 0) policy.min_volume_ml = custody.min_volume_ml();
  if (custody.max_volume_ml() != 0) policy.max_volume_ml = custody.max_volume_ml();
  if (custody.max_shelf_life_seconds() != 0) policy.max_shelf_life_seconds = custody.max_shelf_life_seconds();
  return policy;
}

RuntimeDependencies BuildRuntime(const lifebank::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::LedgerClock> clock) {
  RuntimeDependencies deps;
  deps.repository = BuildRepository(config);
  deps.clock      = std::move(clock);

  deps.role_store   = std::make_shared<access::RoleStore>(deps.repository, deps.clock);
  deps.health_chain = std::make_shared<core::HealthChain>(deps.repository, deps.role_store, deps.clock, PolicyFromConfig(config));
  return deps;
}

} // namespace lifebank::factory
