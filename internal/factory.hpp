#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/access/role_store.hpp"
#include "internal/core/custody_policy.hpp"
#include "internal/core/health_chain.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace lifebank::factory {

/*
  RuntimeDependencies

  Owns all long-lived singletons.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<const util::LedgerClock> clock;

  std::shared_ptr<access::RoleStore> role_store;
  std::shared_ptr<core::HealthChain> health_chain;
};

/*
  BuildRuntime

  Composition root: the only place that knows concrete repository types.
*/
RuntimeDependencies BuildRuntime(const lifebank::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::LedgerClock> clock);

// Zero or absent custody values fall back to CustodyPolicy defaults.
core::CustodyPolicy PolicyFromConfig(const lifebank::runtime::config::RuntimeConfig& config);

} // namespace lifebank::factory
