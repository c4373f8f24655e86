#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/introspector.hpp"
#include "internal/catalog/native_catalog.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/ddl/ddl_executor.hpp"
#include "internal/ddl/statement.hpp"

namespace doccat::core {

struct InstallReport {
  // kinds given a merge view and trigger
  std::vector<std::string> merged;
  // native tables exposed through an alias
  std::vector<std::string> aliased;
};

/*
  Installs and tears down the merged namespace.

  Plans are computed without side effects, then executed as one unit of
  work. A failed install leaves nothing behind (no view without its
  trigger); a failed uninstall leaves everything in place.
*/
class Orchestrator {
 public:
  Orchestrator(std::shared_ptr<catalog::NativeCatalog> catalog, std::shared_ptr<catalog::Introspector> introspector,
               std::shared_ptr<ddl::DdlExecutor> executor, catalog::NamespaceLayout layout);

  /*
    Per native catalog table in name order: merge view then trigger when
    an extended table of the same name exists, an alias otherwise.
  */
  std::vector<ddl::Statement> PlanInstall() const;
  InstallReport               Install();

  /*
    From the catalog: aliases, triggers, views, routines (except
    UNINSTALL), extended tables, then the extended namespace.
  */
  std::vector<ddl::Statement> PlanUninstall() const;
  void                        Uninstall();

 private:
  std::shared_ptr<catalog::NativeCatalog> catalog_;
  std::shared_ptr<catalog::Introspector>  introspector_;
  std::shared_ptr<ddl::DdlExecutor>       executor_;
  catalog::NamespaceLayout                layout_;
};

} // namespace doccat::core
