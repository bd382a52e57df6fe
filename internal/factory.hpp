#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/status_repository.hpp"
#include "internal/session/session_registry.hpp"

namespace inkvault::factory {

/*
  Long-lived objects of one storage root.
*/
struct Application {
  std::shared_ptr<db::StatusRepository>      status;
  std::shared_ptr<session::SessionRegistry> sessions;
};

/*
  Composition root. The only place that knows concrete catalog types.
  Expects a config that already went through ConfigLoader::ApplyDefaults.
*/
Application Build(const inkvault::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::StatusRepository> BuildStatusRepository(const inkvault::runtime::config::RuntimeConfig& config);

session::SessionRegistryOptions BuildSessionOptions(const inkvault::runtime::config::RuntimeConfig& config);

} // namespace inkvault::factory
