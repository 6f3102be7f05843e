#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <optional>
#include <string>
#include <vector>

#include "internal/access/role_store.hpp"
#include "internal/core/health_chain.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace {

using lifebank::db::ErrorCode;
using lifebank::db::Repository;
using lifebank::db::memory::MemoryRepository;
using lifebank::model::BloodStatus;
using lifebank::model::BloodType;
using lifebank::model::BloodUnit;
using lifebank::model::CustodyEvent;
using lifebank::model::CustodyStatus;
using lifebank::model::Role;
using lifebank::model::RoleGrant;
using lifebank::model::TrailMetadata;

std::uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<std::shared_ptr<Repository>()>      make_isolated_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

BloodUnit MakeUnit(lifebank::model::UnitId id, const std::string& bank) {
  BloodUnit unit;
  unit.id                = id;
  unit.blood_type        = BloodType::kABPositive;
  unit.volume_ml         = 350;
  unit.expiration        = 2'000'000'000;
  unit.status            = BloodStatus::kAvailable;
  unit.bank_id           = bank;
  unit.current_custodian = bank;
  unit.registered_at     = 1'700'000'000;
  return unit;
}

CustodyEvent MakeEvent(const std::string& event_id, lifebank::model::UnitId unit_id) {
  CustodyEvent event;
  event.event_id     = event_id;
  event.unit_id      = unit_id;
  event.status       = CustodyStatus::kPending;
  event.initiator    = "bank";
  event.counterparty = "hospital";
  event.created_at   = 1'700'000'100;
  return event;
}

void VerifyInstanceTier(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetInstanceValue(*tx, "health_chain/admin").has_value());

  assert(repo.PutInstanceValue(*tx, "health_chain/admin", "alice"));
  assert(repo.PutInstanceValue(*tx, "health_chain/admin", "bob"));
  assert(repo.GetInstanceValue(*tx, "health_chain/admin") == std::optional<std::string>("bob"));
  tx->Commit();
}

void VerifyRoleGrants(Repository& repo, const std::string& address) {
  auto tx = repo.Begin();
  assert(!repo.GetRoleGrants(*tx, address).has_value());

  std::vector<RoleGrant> grants = {
      RoleGrant{Role::Hospital(), 10, std::nullopt},
      RoleGrant{Role::Custom(3), 11, 500},
      RoleGrant{Role::Custom(9), 12, std::nullopt},
  };
  assert(repo.PutRoleGrants(*tx, address, grants));

  auto read = repo.GetRoleGrants(*tx, address);
  assert(read.has_value() && read->size() == 3);
  assert((*read)[0].role == Role::Hospital());
  assert((*read)[1].role == Role::Custom(3));
  assert((*read)[1].expires_at == std::optional<lifebank::model::Timestamp>(500));
  assert((*read)[2].role == Role::Custom(9));
  assert((*read)[2].granted_at == 12);
  assert(!(*read)[2].expires_at.has_value());

  // replacing shrinks the list
  grants.erase(grants.begin());
  assert(repo.PutRoleGrants(*tx, address, grants));
  assert(repo.GetRoleGrants(*tx, address)->size() == 2);

  auto empty = repo.PutRoleGrants(*tx, address, {});
  assert(!empty && empty.code == ErrorCode::ConstraintViolation);

  assert(repo.DeleteRoleGrants(*tx, address));
  assert(!repo.GetRoleGrants(*tx, address).has_value());
  tx->Commit();
}

void VerifyBloodUnits(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.InsertBloodUnit(*tx, MakeUnit(3, "bank")));
  assert(repo.InsertBloodUnit(*tx, MakeUnit(1, "bank")));
  assert(repo.InsertBloodUnit(*tx, MakeUnit(2, "bank")));

  auto duplicate = repo.InsertBloodUnit(*tx, MakeUnit(2, "bank"));
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto missing = repo.UpdateBloodUnit(*tx, MakeUnit(40, "bank"));
  assert(missing.code == ErrorCode::NotFound);

  auto unit         = *repo.GetBloodUnit(*tx, 2);
  unit.status       = BloodStatus::kReserved;
  unit.donor_id     = "D_17";
  unit.allocated_to = "hospital";
  assert(repo.UpdateBloodUnit(*tx, unit));

  auto read = repo.GetBloodUnit(*tx, 2);
  assert(read.has_value());
  assert(read->status == BloodStatus::kReserved);
  assert(read->blood_type == BloodType::kABPositive);
  assert(read->donor_id == std::optional<std::string>("D_17"));
  assert(read->allocated_to == std::optional<std::string>("hospital"));
  assert(read->expiration == 2'000'000'000);

  auto all = repo.ListBloodUnits(*tx);
  assert(all.size() == 3);
  assert(all[0].id == 1 && all[1].id == 2 && all[2].id == 3);
  assert(!repo.GetBloodUnit(*tx, 99).has_value());
  tx->Commit();
}

void VerifyCustodyEventsAndTrail(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertBloodUnit(*tx, MakeUnit(10, "bank")));

  assert(repo.InsertCustodyEvent(*tx, MakeEvent("evt-b", 10)));
  assert(repo.InsertCustodyEvent(*tx, MakeEvent("evt-a", 10)));
  assert(repo.InsertCustodyEvent(*tx, MakeEvent("evt-a", 10)).code == ErrorCode::AlreadyExists);

  auto event        = *repo.GetCustodyEvent(*tx, "evt-b");
  event.status      = CustodyStatus::kCancelled;
  event.resolved_at = 1'700'002'000;
  assert(repo.UpdateCustodyEvent(*tx, event));

  auto moved    = event;
  moved.unit_id = 11;
  assert(!repo.UpdateCustodyEvent(*tx, moved));
  assert(repo.UpdateCustodyEvent(*tx, MakeEvent("evt-none", 10)).code == ErrorCode::NotFound);

  // insertion order, not id order
  auto events = repo.ListCustodyEvents(*tx, 10);
  assert(events.size() == 2);
  assert(events[0].event_id == "evt-b");
  assert(events[0].status == CustodyStatus::kCancelled);
  assert(events[0].resolved_at == std::optional<lifebank::model::Timestamp>(1'700'002'000));
  assert(events[1].event_id == "evt-a");
  assert(events[1].prior_status == BloodStatus::kReserved);
  assert(repo.ListCustodyEvents(*tx, 11).empty());

  assert(!repo.GetTrailMetadata(*tx, 10).has_value());
  assert(repo.UpsertTrailMetadata(*tx, TrailMetadata{10, 1, 1'700'003'000}));
  assert(repo.UpsertTrailMetadata(*tx, TrailMetadata{10, 2, 1'700'004'000}));
  auto trail = repo.GetTrailMetadata(*tx, 10);
  assert(trail.has_value() && trail->total_events == 2);
  assert(trail->last_confirmed_at == std::optional<lifebank::model::Timestamp>(1'700'004'000));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBloodUnit(*tx, MakeUnit(500, "bank")));
    assert(repo.PutInstanceValue(*tx, "rollback/key", "value"));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.InsertBloodUnit(*tx, MakeUnit(501, "bank")));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetBloodUnit(*check_tx, 500).has_value());
  assert(!repo.GetBloodUnit(*check_tx, 501).has_value());
  assert(!repo.GetInstanceValue(*check_tx, "rollback/key").has_value());
  check_tx->Commit();
}

void VerifyConcurrentCommits(Repository& repo, bool supports_parallel_transactions) {
  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  assert(repo.PutInstanceValue(*tx1, "race/key", "first"));
  assert(repo.PutInstanceValue(*tx2, "race/key", "second"));
  tx1->Commit();

  // the second writer started from a stale snapshot
  bool threw = false;
  try {
    tx2->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto verify_tx = repo.Begin();
  assert(repo.GetInstanceValue(*verify_tx, "race/key") == std::optional<std::string>("first"));
  verify_tx->Commit();
}

void VerifyCustodyScenario(const std::shared_ptr<Repository>& repo) {
  auto clock = std::make_shared<lifebank::util::ManualClock>(1'700'000'000);
  auto roles = std::make_shared<lifebank::access::RoleStore>(repo, clock);

  lifebank::core::HealthChain chain(repo, roles, clock, lifebank::core::CustodyPolicy{});
  chain.Initialize("admin");
  chain.RegisterBloodBank("admin", "scenario-bank");
  chain.RegisterHospital("admin", "scenario-hospital");

  const auto unit_id = chain.RegisterBlood("scenario-bank", BloodType::kONegative, 450, clock->Now() + 7 * lifebank::util::kSecondsPerDay,
                                           std::string("donor_1"));
  chain.AllocateBlood("scenario-bank", unit_id, "scenario-hospital");

  const auto cancelled = chain.InitiateTransfer("scenario-bank", unit_id);
  assert(chain.TryCancelTransfer("scenario-bank", cancelled).code == lifebank::util::ErrorCode::CooldownNotElapsed);
  clock->Advance(1800);
  chain.CancelTransfer("scenario-bank", cancelled);

  const auto confirmed = chain.InitiateTransfer("scenario-bank", unit_id);
  chain.ConfirmTransfer("scenario-hospital", confirmed);

  auto unit = chain.GetBloodUnit(unit_id);
  assert(unit.status == BloodStatus::kDelivered);
  assert(unit.current_custodian == "scenario-hospital");
  assert(chain.GetCustodyTrailMetadata(unit_id).total_events == 1);

  auto trail = chain.GetCustodyTrail(unit_id);
  assert(trail.size() == 1 && trail[0].event_id == confirmed);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->PutInstanceValue(*tx, "health_chain/next_unit_id", "801"));
    assert(repo->InsertBloodUnit(*tx, MakeUnit(800, "durable-bank")));
    assert(repo->InsertCustodyEvent(*tx, MakeEvent("evt-durable", 800)));
    assert(repo->PutRoleGrants(*tx, "durable-bank", {RoleGrant{Role::BloodBank(), 1, std::nullopt}}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetInstanceValue(*tx, "health_chain/next_unit_id") == std::optional<std::string>("801"));
  assert(repo->GetBloodUnit(*tx, 800).has_value());
  assert(repo->GetCustodyEvent(*tx, "evt-durable").has_value());
  assert(repo->GetRoleGrants(*tx, "durable-bank")->size() == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                     = "memory",
      .make_repository          = []() { return std::make_shared<MemoryRepository>(); },
      .make_isolated_repository = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart         = []() { return false; },
      .restart                  = [](std::shared_ptr<Repository>&) {},
      .cleanup                  = []() {},
      .supports_parallel_transactions = true,
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("lifebank_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<lifebank::db::sqlite::SqliteDB>(db_path);
    lifebank::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<lifebank::db::sqlite::SqliteRepository>(std::move(db));
  };

  auto make_isolated = []() {
    auto db = std::make_shared<lifebank::db::sqlite::SqliteDB>(":memory:");
    lifebank::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<lifebank::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                     = "sqlite",
      .make_repository          = make_repo,
      .make_isolated_repository = make_isolated,
      .supports_restart         = []() { return true; },
      .restart                  = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                  = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyInstanceTier(*repo);
    VerifyRoleGrants(*repo, backend.name + "-grants");
    VerifyBloodUnits(*repo);
    VerifyCustodyEventsAndTrail(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyConcurrentCommits(*repo, backend.supports_parallel_transactions);
  }

  VerifyCustodyScenario(backend.make_isolated_repository());
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "lifebank_integration_repository_parity: pass\n";
  return 0;
}
