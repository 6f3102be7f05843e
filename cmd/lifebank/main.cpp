#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/parse.hpp"
#include "internal/util/status.hpp"
#include "internal/util/time.hpp"

using namespace lifebank;

static void Usage() {
  std::cout << "Usage:\n"
            << "  lifebank --config <file.yaml> <caller> <command> [args...]\n"
            << "\n"
            << "Access control:\n"
            << "  init-access\n"
            << "  grant-role <address> <role> [expires_at]\n"
            << "  revoke-role <address> <role>\n"
            << "  has-role <address> <role>\n"
            << "  roles <address>\n"
            << "  cleanup-roles <address>\n"
            << "\n"
            << "Custody:\n"
            << "  init-chain\n"
            << "  register-bank <address>\n"
            << "  register-hospital <address>\n"
            << "  register-blood <type> <volume_ml> <expiration> [donor_id]\n"
            << "  allocate <unit_id> <hospital>\n"
            << "  initiate <unit_id>\n"
            << "  confirm <event_id>\n"
            << "  cancel <event_id>\n"
            << "  expire\n"
            << "  unit <unit_id>\n"
            << "  event <event_id>\n"
            << "  trail <unit_id>\n"
            << "  trail-metadata <unit_id>\n"
            << "\n"
            << "Roles: admin hospital donor rider blood_bank custom:<n>\n"
            << "Blood types: A+ A- B+ B- AB+ AB- O+ O-\n";
}

static model::Role RequireRole(const std::string& text) {
  auto role = model::ParseRole(text);
  if (!role.has_value()) {
    throw util::InvalidInput("unknown role: " + text);
  }
  return *role;
}

static std::string OptionalTime(const std::optional<model::Timestamp>& ts) {
  return ts ? std::to_string(*ts) : "-";
}

static void PrintUnit(const model::BloodUnit& unit) {
  std::cout << "id=" << unit.id << "\n"
            << "blood_type=" << model::ToString(unit.blood_type) << "\n"
            << "volume_ml=" << unit.volume_ml << "\n"
            << "expiration=" << unit.expiration << "\n"
            << "status=" << model::ToString(unit.status) << "\n"
            << "bank_id=" << unit.bank_id << "\n"
            << "donor_id=" << unit.donor_id.value_or("-") << "\n"
            << "current_custodian=" << unit.current_custodian << "\n"
            << "allocated_to=" << unit.allocated_to.value_or("-") << "\n"
            << "registered_at=" << unit.registered_at << "\n";
}

static void PrintEvent(const model::CustodyEvent& event) {
  std::cout << "event_id=" << event.event_id << "\n"
            << "unit_id=" << event.unit_id << "\n"
            << "status=" << model::ToString(event.status) << "\n"
            << "initiator=" << event.initiator << "\n"
            << "counterparty=" << event.counterparty << "\n"
            << "created_at=" << event.created_at << "\n"
            << "resolved_at=" << OptionalTime(event.resolved_at) << "\n";
}

static int Run(factory::RuntimeDependencies& deps, const std::string& caller, const std::string& cmd, const std::vector<std::string>& args) {
  auto& roles = *deps.role_store;
  auto& chain = *deps.health_chain;

  auto need = [&](std::size_t n) {
    if (args.size() < n) {
      throw util::InvalidInput(cmd + ": expected " + std::to_string(n) + " argument(s)");
    }
  };

  // ------------------------------------------------------------
  // Access control
  // ------------------------------------------------------------

  if (cmd == "init-access") {
    roles.Initialize(caller);
    std::cout << "access control admin=" << caller << "\n";
    return 0;
  }

  if (cmd == "grant-role") {
    need(2);
    std::optional<model::Timestamp> expires_at;
    if (args.size() >= 3) {
      expires_at = util::ParseUint(args[2], "expires_at");
    }
    roles.GrantRoleWithExpiry(caller, args[0], RequireRole(args[1]), expires_at);
    std::cout << "granted " << args[1] << " to " << args[0] << "\n";
    return 0;
  }

  if (cmd == "revoke-role") {
    need(2);
    roles.RevokeRole(caller, args[0], RequireRole(args[1]));
    std::cout << "revoked " << args[1] << " from " << args[0] << "\n";
    return 0;
  }

  if (cmd == "has-role") {
    need(2);
    const bool has = roles.HasRole(args[0], RequireRole(args[1]));
    std::cout << (has ? "true" : "false") << "\n";
    return has ? 0 : 3;
  }

  if (cmd == "roles") {
    need(1);
    for (const auto& grant : roles.GetRoles(args[0])) {
      std::cout << model::ToString(grant.role) << " granted_at=" << grant.granted_at << " expires_at=" << OptionalTime(grant.expires_at)
                << "\n";
    }
    return 0;
  }

  if (cmd == "cleanup-roles") {
    need(1);
    std::cout << "removed=" << roles.CleanupExpiredRoles(caller, args[0]) << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  // Custody
  // ------------------------------------------------------------

  if (cmd == "init-chain") {
    chain.Initialize(caller);
    std::cout << "health chain admin=" << caller << "\n";
    return 0;
  }

  if (cmd == "register-bank") {
    need(1);
    chain.RegisterBloodBank(caller, args[0]);
    std::cout << "registered blood bank " << args[0] << "\n";
    return 0;
  }

  if (cmd == "register-hospital") {
    need(1);
    chain.RegisterHospital(caller, args[0]);
    std::cout << "registered hospital " << args[0] << "\n";
    return 0;
  }

  if (cmd == "register-blood") {
    need(3);
    auto type = model::ParseBloodType(args[0]);
    if (!type.has_value()) {
      throw util::InvalidInput("unknown blood type: " + args[0]);
    }
    const auto volume = util::ParseUint(args[1], "volume_ml");
    if (volume > UINT32_MAX) {
      throw util::InvalidInput("volume_ml out of range");
    }
    std::optional<std::string> donor;
    if (args.size() >= 4) {
      donor = args[3];
    }
    const auto id = chain.RegisterBlood(caller, *type, static_cast<std::uint32_t>(volume), util::ParseUint(args[2], "expiration"), donor);
    std::cout << "unit_id=" << id << "\n";
    return 0;
  }

  if (cmd == "allocate") {
    need(2);
    chain.AllocateBlood(caller, util::ParseUint(args[0], "unit_id"), args[1]);
    std::cout << "allocated unit " << args[0] << " to " << args[1] << "\n";
    return 0;
  }

  if (cmd == "initiate") {
    need(1);
    std::cout << "event_id=" << chain.InitiateTransfer(caller, util::ParseUint(args[0], "unit_id")) << "\n";
    return 0;
  }

  if (cmd == "confirm") {
    need(1);
    chain.ConfirmTransfer(caller, args[0]);
    std::cout << "confirmed " << args[0] << "\n";
    return 0;
  }

  if (cmd == "cancel") {
    need(1);
    chain.CancelTransfer(caller, args[0]);
    std::cout << "cancelled " << args[0] << "\n";
    return 0;
  }

  if (cmd == "expire") {
    std::cout << "expired=" << chain.ExpireBloodUnits(caller) << "\n";
    return 0;
  }

  if (cmd == "unit") {
    need(1);
    PrintUnit(chain.GetBloodUnit(util::ParseUint(args[0], "unit_id")));
    return 0;
  }

  if (cmd == "event") {
    need(1);
    PrintEvent(chain.GetCustodyEvent(args[0]));
    return 0;
  }

  if (cmd == "trail") {
    need(1);
    for (const auto& event : chain.GetCustodyTrail(util::ParseUint(args[0], "unit_id"))) {
      std::cout << event.event_id << " " << event.initiator << " -> " << event.counterparty << " at " << OptionalTime(event.resolved_at)
                << "\n";
    }
    return 0;
  }

  if (cmd == "trail-metadata") {
    need(1);
    auto trail = chain.GetCustodyTrailMetadata(util::ParseUint(args[0], "unit_id"));
    std::cout << "unit_id=" << trail.unit_id << "\n"
              << "total_events=" << trail.total_events << "\n"
              << "last_confirmed_at=" << OptionalTime(trail.last_confirmed_at) << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 5 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              caller      = argv[3];
  const std::string              cmd         = argv[4];
  const std::vector<std::string> args(argv + 5, argv + argc);

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto deps = factory::BuildRuntime(config, std::make_shared<util::SystemClock>());
    const int rc = Run(deps, caller, cmd, args);

    observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    auto status = util::ToStatus(e);
    std::cerr << util::ErrorCodeName(status.code) << ": " << e.what() << "\n";
    LIFEBANK_LOG_ERROR("command failed", {observability::StringField("command", cmd), observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return 2;
  }
}
