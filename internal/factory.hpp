#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/permission_client.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/error_taxonomy.hpp"
#include "internal/transport/transport.hpp"

namespace permit::factory {

/*
  RuntimeDependencies

  Owns all long-lived singletons used by the client.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<const model::ErrorTaxonomy> taxonomy;
  std::shared_ptr<transport::Transport>       transport;
  std::shared_ptr<core::PermissionClient>     client;
};

/*
  Build

  Constructs the client from runtime config around the given transport.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies Build(const permit::runtime::config::RuntimeConfig& config, std::shared_ptr<transport::Transport> transport);

std::shared_ptr<db::Repository> BuildRepository(const permit::runtime::config::RuntimeConfig& config);

// Built-in table plus configured extra codes. Unknown kind names are skipped.
std::shared_ptr<const model::ErrorTaxonomy> BuildTaxonomy(const permit::runtime::config::ErrorTaxonomyConfig& config);

} // namespace permit::factory
