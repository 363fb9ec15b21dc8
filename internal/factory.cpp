#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace permit::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const permit::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::PermissionChangeSchema());

    PERMIT_LOG_INFO("sqlite store opened", {StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<const model::ErrorTaxonomy> BuildTaxonomy(const permit::runtime::config::ErrorTaxonomyConfig& config) {
  auto taxonomy = std::make_shared<model::ErrorTaxonomy>(model::ErrorTaxonomy::Builtin());
  if (config.version() != 0) {
    taxonomy->SetVersion(config.version());
  }

  for (const auto& entry : config.extra_codes()) {
    const auto kind = model::ParseErrorKind(entry.kind());
    if (!kind) {
      PERMIT_LOG_WARN("ignoring error taxonomy entry", {IntField("code", entry.code()), StringField("kind", entry.kind())});
      continue;
    }

    // A newer authority may renumber; the configured kind wins.
    const auto previous  = taxonomy->Lookup(entry.code());
    const bool overrides = taxonomy->Contains(entry.code()) && previous != *kind;
    if (!taxonomy->Register(entry.code(), *kind)) {
      PERMIT_LOG_WARN("ignoring error taxonomy entry", {IntField("code", entry.code()), StringField("kind", entry.kind())});
      continue;
    }
    if (overrides) {
      PERMIT_LOG_INFO("error taxonomy entry replaces builtin kind",
                      {IntField("code", entry.code()), StringField("kind", entry.kind()), StringField("previous_kind", model::ToString(previous))});
    }
  }

  return taxonomy;
}

/*
    Build full client dependency graph
*/
RuntimeDependencies Build(const permit::runtime::config::RuntimeConfig& config, std::shared_ptr<transport::Transport> transport) {
  RuntimeDependencies deps;

  deps.repository = BuildRepository(config);
  deps.taxonomy   = BuildTaxonomy(config.error_taxonomy());
  deps.transport  = std::move(transport);

  core::ClientOptions options;
  options.refresh_updated_at_on_status = config.requests().refresh_updated_at_on_status();

  deps.client = std::make_shared<core::PermissionClient>(deps.repository, deps.transport, deps.taxonomy, options);

  PERMIT_LOG_INFO("permission client ready", {IntField("taxonomy_version", deps.taxonomy->Version()),
                                              IntField("taxonomy_codes", static_cast<std::int64_t>(deps.taxonomy->Size()))});
  return deps;
}

} // namespace permit::factory
