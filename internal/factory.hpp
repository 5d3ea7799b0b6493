#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/db_manager.hpp"
#include "internal/locator/aggregate_batch_locator.hpp"
#include "internal/locator/callback_registry_batch_locator.hpp"

namespace dbmgr::factory {

/*
  Application

  Everything a host needs after wiring. The callback registry stays
  reachable so code batches can be registered before Initialize().
*/
struct Application {
  std::shared_ptr<core::DbManager>                       manager;
  std::shared_ptr<locator::AggregateBatchLocator>        batch_locator;
  std::shared_ptr<locator::CallbackRegistryBatchLocator> callbacks;
};

/*
  Build

  Constructs the manager and its collaborators from config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const dbmgr::runtime::config::ManagerConfig& config);

} // namespace dbmgr::factory
