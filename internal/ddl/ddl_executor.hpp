#pragma once

#include <memory>
#include <vector>

#include "internal/catalog/introspector.hpp"
#include "internal/catalog/native_catalog.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/ddl/statement.hpp"

namespace doccat::ddl {

/*
  Runs DDL statements and keeps the native catalog in step with them.

  Drops are restricted: an object still referenced by a view or trigger,
  or a namespace that still holds objects or routines, raises
  TeardownBlocked and nothing is dropped.
*/
class DdlExecutor {
 public:
  DdlExecutor(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<catalog::NativeCatalog> catalog,
              std::shared_ptr<catalog::Introspector> introspector);

  void Execute(const Statement& stmt);

  // all statements in one unit of work; the first failure undoes the rest
  void ExecuteAll(const std::vector<Statement>& statements);

 private:
  void Apply(const CreateSchema& stmt);
  void Apply(const DropSchema& stmt);
  void Apply(const CreateTable& stmt);
  void Apply(const CreateView& stmt);
  void Apply(const CreateAlias& stmt);
  void Apply(const CreateTrigger& stmt);
  void Apply(const CreateRoutine& stmt);
  void Apply(const DropObject& stmt);

  void RequireSchema(const std::string& schema) const;
  void RequireNoDependents(const QualifiedName& object) const;

  std::shared_ptr<db::sqlite::SqliteDB>   db_;
  std::shared_ptr<catalog::NativeCatalog> catalog_;
  std::shared_ptr<catalog::Introspector>  introspector_;
};

} // namespace doccat::ddl
