#include "internal/ddl/ddl_executor.hpp"

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace doccat::ddl {

using catalog::TableType;

DdlExecutor::DdlExecutor(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<catalog::NativeCatalog> catalog,
                         std::shared_ptr<catalog::Introspector> introspector)
    : db_(std::move(db)), catalog_(std::move(catalog)), introspector_(std::move(introspector)) {
}

void DdlExecutor::Execute(const Statement& stmt) {
  DOCCAT_LOG_DEBUG("ddl", {observability::StringField("statement", Describe(stmt)),
                           observability::StringField("sql", ToSql(stmt))});

  // each statement and its catalog bookkeeping succeed or fail together
  db::sqlite::SqliteTransaction tx(db_);
  std::visit([this](const auto& s) { Apply(s); }, stmt);
  tx.Commit();
}

void DdlExecutor::ExecuteAll(const std::vector<Statement>& statements) {
  db::sqlite::SqliteTransaction tx(db_);
  for (const auto& stmt : statements) {
    Execute(stmt);
  }
  tx.Commit();
}

void DdlExecutor::Apply(const CreateSchema& stmt) {
  if (catalog_->SchemaExists(stmt.schema)) {
    throw util::AlreadyExists("namespace " + stmt.schema + " already exists");
  }
  catalog_->RegisterSchema(stmt.schema);
}

void DdlExecutor::Apply(const DropSchema& stmt) {
  RequireSchema(stmt.schema);

  std::vector<std::string> blockers;
  for (const auto& object : introspector_->ObjectsIn(stmt.schema)) {
    blockers.push_back(object.Describe());
  }
  for (const auto& routine : catalog_->RoutinesIn(stmt.schema)) {
    blockers.push_back("routine " + stmt.schema + "." + routine);
  }
  if (!blockers.empty()) {
    throw util::TeardownBlocked("namespace " + stmt.schema, std::move(blockers));
  }

  catalog_->UnregisterSchema(stmt.schema);
}

void DdlExecutor::Apply(const CreateTable& stmt) {
  RequireSchema(stmt.table.schema);
  db_->Exec(ToSql(stmt));
  catalog_->RegisterTable(stmt.table, TableType::kTable, introspector_->ColumnsOf(stmt.table));
}

void DdlExecutor::Apply(const CreateView& stmt) {
  RequireSchema(stmt.view.schema);
  db_->Exec(ToSql(stmt));
  catalog_->RegisterTable(stmt.view, TableType::kView, introspector_->ColumnsOf(stmt.view));
}

void DdlExecutor::Apply(const CreateAlias& stmt) {
  RequireSchema(stmt.alias.schema);
  if (!introspector_->TableExists(stmt.target)) {
    throw util::MetadataNotFound("alias target " + stmt.target.Physical() + " does not exist");
  }
  db_->Exec(ToSql(stmt));
  catalog_->RegisterTable(stmt.alias, TableType::kAlias, introspector_->ColumnsOf(stmt.alias));
}

void DdlExecutor::Apply(const CreateTrigger& stmt) {
  db_->Exec(ToSql(stmt));
  catalog_->RegisterTrigger(stmt.trigger, stmt.view);
}

void DdlExecutor::Apply(const CreateRoutine& stmt) {
  RequireSchema(stmt.routine.schema);
  if (catalog_->RoutineExists(stmt.routine)) {
    throw util::AlreadyExists("routine " + stmt.routine.Physical() + " already exists");
  }

  catalog::RoutineEntry entry;
  entry.specific     = stmt.routine;
  entry.routine_name = stmt.routine.name;
  entry.routine_type = stmt.routine_type;
  entry.parameters   = stmt.parameters;
  catalog_->RegisterRoutine(entry);
}

void DdlExecutor::Apply(const DropObject& stmt) {
  if (stmt.type == ObjectType::kRoutine) {
    if (!catalog_->RoutineExists(stmt.name)) {
      throw util::MetadataNotFound("routine " + stmt.name.Physical() + " does not exist");
    }
    catalog_->UnregisterRoutine(stmt.name);
    return;
  }

  if (!introspector_->ObjectExists(stmt.name)) {
    throw util::MetadataNotFound(stmt.name.Physical() + " does not exist");
  }

  if (stmt.type == ObjectType::kTrigger) {
    db_->Exec(ToSql(stmt));
    catalog_->UnregisterTrigger(stmt.name);
    return;
  }

  RequireNoDependents(stmt.name);
  db_->Exec(ToSql(stmt));
  catalog_->UnregisterTable(stmt.name);
}

void DdlExecutor::RequireSchema(const std::string& schema) const {
  if (!catalog_->SchemaExists(schema)) {
    throw util::MetadataNotFound("namespace " + schema + " does not exist");
  }
}

void DdlExecutor::RequireNoDependents(const QualifiedName& object) const {
  auto dependents = introspector_->DependentsOf(object);
  if (dependents.empty()) return;

  std::vector<std::string> blockers;
  for (const auto& dependent : dependents) {
    blockers.push_back(dependent.Describe());
  }
  throw util::TeardownBlocked(object.Physical(), std::move(blockers));
}

} // namespace doccat::ddl
