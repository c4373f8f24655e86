#include "internal/core/deployment.hpp"

#include "internal/core/routines.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace doccat::core {

Deployment::Deployment(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<catalog::NativeCatalog> catalog,
                       std::shared_ptr<ddl::DdlExecutor> executor, std::shared_ptr<store::ExtendedStore> store,
                       std::shared_ptr<Orchestrator> orchestrator, std::shared_ptr<sync::CommentImporter> importer,
                       catalog::NamespaceLayout layout, bool import_on_setup)
    : db_(std::move(db)),
      catalog_(std::move(catalog)),
      executor_(std::move(executor)),
      store_(std::move(store)),
      orchestrator_(std::move(orchestrator)),
      importer_(std::move(importer)),
      layout_(std::move(layout)),
      import_on_setup_(import_on_setup) {
}

bool Deployment::IsInstalled() const {
  return catalog_->SchemaExists(layout_.merged);
}

SetupReport Deployment::Setup() {
  if (IsInstalled()) {
    throw util::AlreadyExists("namespace " + layout_.merged + " already exists; remove the deployment first");
  }

  std::vector<ddl::Statement> plan;
  plan.emplace_back(ddl::CreateSchema{layout_.extended});
  plan.emplace_back(ddl::CreateSchema{layout_.merged});
  for (auto& stmt : store_->PlanCreateTables()) {
    plan.push_back(std::move(stmt));
  }
  for (auto& stmt : PlanCreateRoutines(layout_.merged)) {
    plan.push_back(std::move(stmt));
  }

  SetupReport report;
  {
    db::sqlite::SqliteTransaction tx(db_);
    executor_->ExecuteAll(plan);
    report.install = orchestrator_->Install();
    tx.Commit();
  }
  DOCCAT_LOG_INFO("deployment created", {observability::StringField("extended", layout_.extended),
                                         observability::StringField("merged", layout_.merged)});

  if (import_on_setup_) {
    report.import = importer_->ImportFromNative();
  }
  return report;
}

void Deployment::Remove() {
  if (!IsInstalled()) {
    throw util::MetadataNotFound("namespace " + layout_.merged + " does not exist; nothing to remove");
  }

  db::sqlite::SqliteTransaction tx(db_);
  orchestrator_->Uninstall();

  std::vector<ddl::Statement> plan;
  catalog::QualifiedName      uninstall = layout_.Merged(kUninstallRoutine);
  if (catalog_->RoutineExists(uninstall)) {
    plan.emplace_back(ddl::DropObject{ddl::ObjectType::kRoutine, uninstall});
  }
  plan.emplace_back(ddl::DropSchema{layout_.merged});
  executor_->ExecuteAll(plan);
  tx.Commit();

  DOCCAT_LOG_INFO("deployment removed", {observability::StringField("merged", layout_.merged)});
}

} // namespace doccat::core
