#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/catalog/introspector.hpp"
#include "internal/catalog/native_catalog.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/core/deployment.hpp"
#include "internal/core/orchestrator.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/ddl/ddl_executor.hpp"
#include "internal/store/extended_store.hpp"
#include "internal/sync/exporter.hpp"
#include "internal/sync/importer.hpp"

namespace doccat::factory {

/*
  Application

  Owns every component of one doccat run. All of them share the one
  SQLite connection.
*/
struct Application {
  std::shared_ptr<db::sqlite::SqliteDB> db;
  catalog::NamespaceLayout              layout;

  std::shared_ptr<catalog::NativeCatalog> catalog;
  std::shared_ptr<catalog::Introspector>  introspector;
  std::shared_ptr<ddl::DdlExecutor>       executor;
  std::shared_ptr<store::ExtendedStore>   store;
  std::shared_ptr<sync::CommentExporter>  exporter;
  std::shared_ptr<sync::CommentImporter>  importer;
  std::shared_ptr<core::Orchestrator>     orchestrator;
  std::shared_ptr<core::Deployment>       deployment;
};

/*
  Build

  Composition root: opens the configured database, bootstraps the native
  catalog and wires the components. The only place that knows concrete
  types.
*/
Application Build(const doccat::runtime::config::RuntimeConfig& config);

// Same over an already open connection.
Application Build(std::shared_ptr<db::sqlite::SqliteDB> db, catalog::NamespaceLayout layout,
                  bool import_on_setup = false);

} // namespace doccat::factory
