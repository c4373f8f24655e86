#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/observability/logging.hpp"

namespace doccat::factory {

namespace {

catalog::NamespaceLayout LayoutFrom(const doccat::runtime::config::NamespaceConfig& namespaces) {
  catalog::NamespaceLayout layout;
  layout.native   = namespaces.native();
  layout.extended = namespaces.extended();
  layout.merged   = namespaces.merged();
  return layout;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const doccat::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  db::sqlite::SqliteOptions options;
  options.busy_timeout_ms = static_cast<int>(database.busy_timeout_ms());
  options.wal_mode        = database.wal_mode();

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.path(), options);
  DOCCAT_LOG_DEBUG("database opened", {observability::StringField("path", database.path())});

  return Build(std::move(sqlite_db), LayoutFrom(config.namespaces()), config.sync().import_on_setup());
}

Application Build(std::shared_ptr<db::sqlite::SqliteDB> db, catalog::NamespaceLayout layout, bool import_on_setup) {
  Application app;
  app.db     = std::move(db);
  app.layout = std::move(layout);

  // ------------------------------------------------------------------
  // Catalog
  // ------------------------------------------------------------------
  app.catalog = std::make_shared<catalog::NativeCatalog>(app.db, app.layout.native);
  app.catalog->Bootstrap();
  app.introspector = std::make_shared<catalog::Introspector>(app.db);

  // ------------------------------------------------------------------
  // DDL, store and sync
  // ------------------------------------------------------------------
  app.executor = std::make_shared<ddl::DdlExecutor>(app.db, app.catalog, app.introspector);
  app.store    = std::make_shared<store::ExtendedStore>(app.db, app.introspector, app.layout);
  app.exporter = std::make_shared<sync::CommentExporter>(app.db, app.introspector, app.layout);
  app.importer = std::make_shared<sync::CommentImporter>(app.db, app.introspector, app.layout);

  // ------------------------------------------------------------------
  // Lifecycle
  // ------------------------------------------------------------------
  app.orchestrator = std::make_shared<core::Orchestrator>(app.catalog, app.introspector, app.executor, app.layout);
  app.deployment   = std::make_shared<core::Deployment>(app.db, app.catalog, app.executor, app.store,
                                                        app.orchestrator, app.importer, app.layout, import_on_setup);

  return app;
}

} // namespace doccat::factory
