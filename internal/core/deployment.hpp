#pragma once

#include <memory>
#include <optional>

#include "internal/catalog/native_catalog.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/core/orchestrator.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/ddl/ddl_executor.hpp"
#include "internal/store/extended_store.hpp"
#include "internal/sync/importer.hpp"

namespace doccat::core {

struct SetupReport {
  InstallReport                     install;
  std::optional<sync::ImportReport> import;
};

/*
  Whole-deployment lifecycle: namespaces, extended tables and generated
  routines around the orchestrator's install / uninstall.
*/
class Deployment {
 public:
  Deployment(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<catalog::NativeCatalog> catalog,
             std::shared_ptr<ddl::DdlExecutor> executor, std::shared_ptr<store::ExtendedStore> store,
             std::shared_ptr<Orchestrator> orchestrator, std::shared_ptr<sync::CommentImporter> importer,
             catalog::NamespaceLayout layout, bool import_on_setup);

  // the merged namespace exists
  bool IsInstalled() const;

  /*
    Creates both namespaces, the extended tables and the routines, then
    installs, in one unit of work. Throws AlreadyExists when the merged
    namespace is present. Imports native comments afterwards when
    configured to.
  */
  SetupReport Setup();

  // Uninstall, then the UNINSTALL routine and the merged namespace.
  void Remove();

 private:
  std::shared_ptr<db::sqlite::SqliteDB>   db_;
  std::shared_ptr<catalog::NativeCatalog> catalog_;
  std::shared_ptr<ddl::DdlExecutor>       executor_;
  std::shared_ptr<store::ExtendedStore>   store_;
  std::shared_ptr<Orchestrator>           orchestrator_;
  std::shared_ptr<sync::CommentImporter>  importer_;
  catalog::NamespaceLayout                layout_;
  bool                                    import_on_setup_ = false;
};

} // namespace doccat::core
