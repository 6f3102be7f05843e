#include "internal/core/blood_registry.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using lifebank::core::BloodRegistry;
using lifebank::core::CustodyPolicy;
using lifebank::db::memory::MemoryRepository;
using lifebank::model::BloodStatus;
using lifebank::model::BloodType;
using lifebank::util::kSecondsPerDay;
using lifebank::util::ManualClock;

constexpr lifebank::util::Timestamp kStart  = 1'700'000'000;
constexpr lifebank::util::Timestamp kExpiry = kStart + 30 * kSecondsPerDay;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock = std::make_shared<ManualClock>(kStart);
  BloodRegistry                     registry{repo, clock, CustodyPolicy{}};

  lifebank::model::UnitId Register(const std::string& bank, lifebank::util::Timestamp expiration = kExpiry) {
    auto tx = repo->Begin();
    auto id = registry.Register(*tx, bank, BloodType::kONegative, 450, expiration, std::string("donor_7"));
    tx->Commit();
    return id;
  }
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestRegisterAssignsMonotonicIds() {
  Fixture f;
  assert(f.Register("bank-a") == 1);
  assert(f.Register("bank-b") == 2);
  assert(f.Register("bank-a") == 3);

  auto tx   = f.repo->Begin();
  auto unit = f.registry.Load(*tx, 2);
  assert(unit.bank_id == "bank-b");
  assert(unit.current_custodian == "bank-b");
  assert(unit.status == BloodStatus::kAvailable);
  assert(unit.blood_type == BloodType::kONegative);
  assert(unit.donor_id == std::optional<std::string>("donor_7"));
  assert(unit.registered_at == kStart);
  assert(!unit.allocated_to.has_value());
}

void TestRegistrationValidation() {
  Fixture f;
  auto    tx = f.repo->Begin();

  using lifebank::util::InvalidInput;
  assert(Throws<InvalidInput>([&] { f.registry.Register(*tx, "bank", BloodType::kAPositive, 99, kExpiry, std::nullopt); }));
  assert(Throws<InvalidInput>([&] { f.registry.Register(*tx, "bank", BloodType::kAPositive, 601, kExpiry, std::nullopt); }));
  assert(Throws<InvalidInput>([&] { f.registry.Register(*tx, "bank", BloodType::kAPositive, 300, kStart, std::nullopt); }));
  assert(Throws<InvalidInput>(
      [&] { f.registry.Register(*tx, "bank", BloodType::kAPositive, 300, kStart + 42 * kSecondsPerDay + 1, std::nullopt); }));
  assert(Throws<InvalidInput>([&] { f.registry.Register(*tx, "bank", BloodType::kAPositive, 300, kExpiry, std::string("bad-id")); }));
  assert(Throws<InvalidInput>([&] { f.registry.Register(*tx, "bank", BloodType::kAPositive, 300, kExpiry, std::string()); }));
  assert(Throws<InvalidInput>([&] { f.registry.Register(*tx, "bank", BloodType::kAPositive, 300, kExpiry, std::string(33, 'x')); }));

  // bounds are inclusive
  assert(f.registry.Register(*tx, "bank", BloodType::kAPositive, 100, kStart + 42 * kSecondsPerDay, std::nullopt) == 1);
  assert(f.registry.Register(*tx, "bank", BloodType::kAPositive, 600, kStart + 1, std::string(32, 'x')) == 2);
}

void TestSymbolRules() {
  assert(lifebank::core::IsValidSymbol("D_001"));
  assert(!lifebank::core::IsValidSymbol(""));
  assert(!lifebank::core::IsValidSymbol("with space"));
  assert(!lifebank::core::IsValidSymbol("dash-ed"));
}

void TestAllocate() {
  Fixture f;
  const auto id = f.Register("bank-a");

  {
    auto tx = f.repo->Begin();
    assert(Throws<lifebank::util::Unauthorized>([&] { f.registry.Allocate(*tx, "bank-b", id, "hospital"); }));
    assert(Throws<lifebank::util::NotFound>([&] { f.registry.Allocate(*tx, "bank-a", 99, "hospital"); }));
  }

  {
    auto tx = f.repo->Begin();
    f.registry.Allocate(*tx, "bank-a", id, "hospital");
    tx->Commit();
  }

  auto tx   = f.repo->Begin();
  auto unit = f.registry.Load(*tx, id);
  assert(unit.status == BloodStatus::kReserved);
  assert(unit.allocated_to == std::optional<std::string>("hospital"));
  assert(unit.current_custodian == "bank-a");

  assert(Throws<lifebank::util::InvalidState>([&] { f.registry.Allocate(*tx, "bank-a", id, "hospital"); }));
}

void TestAllocateRejectsExpiredUnit() {
  Fixture f;
  const auto id = f.Register("bank-a", kStart + 60);

  f.clock->Set(kStart + 60);
  auto tx = f.repo->Begin();
  assert(Throws<lifebank::util::InvalidState>([&] { f.registry.Allocate(*tx, "bank-a", id, "hospital"); }));
}

void TestTransitionFollowsLattice() {
  Fixture f;
  const auto id = f.Register("bank-a");

  auto tx   = f.repo->Begin();
  auto unit = f.registry.Load(*tx, id);
  assert(Throws<lifebank::util::InvalidState>([&] { f.registry.Transition(*tx, unit, BloodStatus::kDelivered); }));

  f.registry.Transition(*tx, unit, BloodStatus::kReserved);
  f.registry.Transition(*tx, unit, BloodStatus::kDelivered);
  assert(Throws<lifebank::util::InvalidState>([&] { f.registry.Transition(*tx, unit, BloodStatus::kExpired); }));
  assert(Throws<lifebank::util::InvalidState>([&] { f.registry.Transition(*tx, unit, BloodStatus::kAvailable); }));
  assert(f.registry.Load(*tx, id).status == BloodStatus::kDelivered);
}

void TestExpireDue() {
  Fixture f;
  const auto early = f.Register("bank-a", kStart + 100);
  const auto held  = f.Register("bank-a", kStart + 100);
  const auto late  = f.Register("bank-a", kStart + 1000);

  f.clock->Set(kStart + 100);
  auto tx = f.repo->Begin();
  assert(f.registry.ExpireDue(*tx, [&](lifebank::model::UnitId id) { return id == held; }) == 1);
  assert(f.registry.Load(*tx, early).status == BloodStatus::kExpired);
  assert(f.registry.Load(*tx, held).status == BloodStatus::kAvailable);
  assert(f.registry.Load(*tx, late).status == BloodStatus::kAvailable);

  // once released, only the held unit is left to expire
  assert(f.registry.ExpireDue(*tx, [](lifebank::model::UnitId) { return false; }) == 1);
}

} // namespace

int main() {
  TestRegisterAssignsMonotonicIds();
  TestRegistrationValidation();
  TestSymbolRules();
  TestAllocate();
  TestAllocateRejectsExpiredUnit();
  TestTransitionFollowsLattice();
  TestExpireDue();

  std::cout << "lifebank_unit_blood_registry: pass\n";
  return 0;
}
