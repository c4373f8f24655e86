#include "internal/catalog/native_catalog.hpp"
#include "internal/core/routines.hpp"
#include "internal/ddl/statement.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/catalog_fixture.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace doccat;
using testing::QueryInt;
using testing::QueryText;

namespace {

std::vector<std::string> ColumnNames(const catalog::Introspector& introspector, const catalog::QualifiedName& table) {
  std::vector<std::string> names;
  for (const auto& column : introspector.ColumnsOf(table)) {
    names.push_back(column.name);
  }
  return names;
}

factory::Application SeededApplication() {
  auto app = testing::MakeApplication();
  testing::SeedNativeCatalog(*app.db);
  return app;
}

void TestSetupCreatesMergedNamespace() {
  auto app    = SeededApplication();
  auto report = app.deployment->Setup();

  assert(app.deployment->IsInstalled());
  assert(report.install.merged.size() == catalog::AllKinds().size());
  assert((report.install.aliased == std::vector<std::string>{"REFERENCES", "SEQUENCES"}));
  assert(!report.import.has_value());

  const auto& layout = app.layout;
  for (const auto& kind : catalog::AllKinds()) {
    auto merged = layout.Merged(kind.table);
    assert(app.introspector->TypeOf(merged) == catalog::SchemaObjectType::kView);
    assert(ColumnNames(*app.introspector, merged) == ColumnNames(*app.introspector, layout.Native(kind.table)));
    assert(app.introspector->TypeOf({layout.merged, kind.table + "_SYNC"}) == catalog::SchemaObjectType::kTrigger);
  }

  // generated objects are recorded in the native catalog
  auto& catalog = *app.catalog;
  assert(catalog.SchemaExists("DOCDATA"));
  assert(catalog.TablesOfType("DOCCAT", catalog::TableType::kView).size() == catalog::AllKinds().size());
  assert((catalog.TablesOfType("DOCCAT", catalog::TableType::kAlias) ==
          std::vector<std::string>{"REFERENCES", "SEQUENCES"}));
  assert(catalog.TablesOfType("DOCDATA", catalog::TableType::kTable).size() == catalog::AllKinds().size());
  assert(catalog.TriggersIn("DOCCAT").size() == catalog::AllKinds().size());
  assert(catalog.RoutineExists(layout.Merged(core::kUninstallRoutine)));
  assert(catalog.RoutinesIn("DOCCAT").size() == core::GeneratedRoutines().size());
  assert(QueryInt(*app.db, R"(SELECT COUNT(*) FROM "SYSCAT.ROUTINEPARMS" WHERE "SPECIFICNAME" = 'COPY_ROUTINE')") ==
         3);
}

void TestMergedReadPrefersExtendedComment() {
  auto app = SeededApplication();
  (void)app.deployment->Setup();

  const std::string orders = R"(SELECT "REMARKS" FROM "DOCCAT.TABLES" WHERE "TABSCHEMA" = 'APP' AND "TABNAME" = 'ORDERS')";
  assert(QueryText(*app.db, orders) == std::optional<std::string>("Customer orders"));

  std::string long_text(600, 'o');
  app.db->Exec(R"(INSERT INTO "DOCDATA.TABLES" ("TABSCHEMA", "TABNAME", "REMARKS") VALUES ('APP', 'ORDERS', ')" +
               long_text + "')");
  assert(QueryText(*app.db, orders) == std::optional<std::string>(long_text));

  // native rows without an extended row still show up
  assert(QueryInt(*app.db, R"(SELECT COUNT(*) FROM "DOCCAT.TABLES" WHERE "TABSCHEMA" = 'APP')") == 2);
  assert(QueryInt(*app.db, R"(SELECT COUNT(*) FROM "DOCCAT.SEQUENCES")") == 1);
}

void TestTriggerRoundTrip() {
  auto app = SeededApplication();
  (void)app.deployment->Setup();

  const std::string where  = R"( WHERE "TABSCHEMA" = 'APP' AND "TABNAME" = 'ORDERS' AND "COLNAME" = 'NOTE')";
  const std::string merged = R"(SELECT "REMARKS" FROM "DOCCAT.COLUMNS")" + where;
  const std::string stored = R"(SELECT COUNT(*) FROM "DOCDATA.COLUMNS")" + where;
  const std::string native = R"(SELECT "REMARKS" FROM "SYSCAT.COLUMNS")" + where;

  // absent -> present
  app.db->Exec(R"(UPDATE "DOCCAT.COLUMNS" SET "REMARKS" = 'Free text from the customer')" + where);
  assert(QueryText(*app.db, merged) == std::optional<std::string>("Free text from the customer"));
  assert(QueryInt(*app.db, stored) == 1);
  assert(!QueryText(*app.db, native).has_value());

  // present -> present
  app.db->Exec(R"(UPDATE "DOCCAT.COLUMNS" SET "REMARKS" = 'Customer note')" + where);
  assert(QueryText(*app.db, merged) == std::optional<std::string>("Customer note"));
  assert(QueryInt(*app.db, stored) == 1);

  // present -> absent removes the row
  app.db->Exec(R"(UPDATE "DOCCAT.COLUMNS" SET "REMARKS" = NULL)" + where);
  assert(QueryInt(*app.db, stored) == 0);
  assert(!QueryText(*app.db, merged).has_value());

  // absent -> absent, and empty counts as absent
  app.db->Exec(R"(UPDATE "DOCCAT.COLUMNS" SET "REMARKS" = NULL)" + where);
  app.db->Exec(R"(UPDATE "DOCCAT.COLUMNS" SET "REMARKS" = '')" + where);
  assert(QueryInt(*app.db, stored) == 0);

  // only the comment column is writable through the view
  bool rejected = false;
  try {
    app.db->Exec(R"(UPDATE "DOCCAT.COLUMNS" SET "COLNO" = 7)" + where);
  } catch (const std::runtime_error&) {
    rejected = true;
  }
  assert(rejected);
}

void TestTriggerFillsRoutineParameterDefaults() {
  auto app = SeededApplication();
  (void)app.deployment->Setup();

  app.db->Exec(R"(UPDATE "DOCCAT.ROUTINEPARMS" SET "REMARKS" = 'Retention in days' WHERE "SPECIFICNAME" = 'PURGE_V1')");
  assert(QueryText(*app.db, R"(SELECT "PARMNAME" FROM "DOCDATA.ROUTINEPARMS" WHERE "SPECIFICNAME" = 'PURGE_V1')") ==
         std::optional<std::string>("P1"));

  app.db->Exec(R"(UPDATE "DOCCAT.ROUTINEPARMS" SET "REMARKS" = 'Orphan' WHERE "ROUTINESCHEMA" IS NULL)");
  assert(QueryInt(*app.db, R"(SELECT COUNT(*) FROM "DOCDATA.ROUTINEPARMS" WHERE "ROUTINESCHEMA" = '' AND "SPECIFICNAME" = '')") ==
         1);
  assert(QueryText(*app.db, R"(SELECT "REMARKS" FROM "DOCCAT.ROUTINEPARMS" WHERE "ROUTINESCHEMA" IS NULL)") ==
         std::optional<std::string>("Orphan"));
  assert(QueryText(*app.db, R"(SELECT "PARMNAME" FROM "DOCDATA.ROUTINEPARMS" WHERE "ROUTINESCHEMA" = '')") ==
         std::optional<std::string>("X"));
}

void TestUninstallRightAfterInstall() {
  auto app = SeededApplication();
  (void)app.deployment->Setup();

  auto plan = app.orchestrator->PlanUninstall();
  assert(!plan.empty());
  assert(ddl::Describe(plan.front()) == "drop alias DOCCAT.REFERENCES");
  assert(ddl::Describe(plan.back()) == "drop schema DOCDATA");

  app.orchestrator->Uninstall();
  assert(app.introspector->ObjectsIn("DOCCAT").empty());
  assert(app.introspector->ObjectsIn("DOCDATA").empty());
  assert(!app.catalog->SchemaExists("DOCDATA"));
  assert((app.catalog->RoutinesIn("DOCCAT") == std::vector<std::string>{std::string(core::kUninstallRoutine)}));

  // the native catalog itself is untouched
  assert(QueryText(*app.db, R"(SELECT "REMARKS" FROM "SYSCAT.TABLES" WHERE "TABNAME" = 'ORDERS')") ==
         std::optional<std::string>("Customer orders"));
}

void TestSetupRemoveSetup() {
  auto app = SeededApplication();
  (void)app.deployment->Setup();
  app.deployment->Remove();

  assert(!app.deployment->IsInstalled());
  assert(app.catalog->RoutinesIn("DOCCAT").empty());
  assert(QueryInt(*app.db, R"(SELECT COUNT(*) FROM "SYSCAT.TABLES" WHERE "TABSCHEMA" IN ('DOCCAT', 'DOCDATA'))") == 0);

  auto report = app.deployment->Setup();
  assert(app.deployment->IsInstalled());
  assert(report.install.merged.size() == catalog::AllKinds().size());
}

void TestSetupTwiceIsRejected() {
  auto app = SeededApplication();
  (void)app.deployment->Setup();

  bool threw = false;
  try {
    (void)app.deployment->Setup();
  } catch (const util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestRemoveIsBlockedByForeignDependents() {
  auto app = SeededApplication();
  (void)app.deployment->Setup();
  app.db->Exec(R"(CREATE VIEW "APP.COLUMN_NOTES" AS SELECT "REMARKS" FROM "DOCDATA.COLUMNS")");

  bool threw = false;
  try {
    app.deployment->Remove();
  } catch (const util::TeardownBlocked& e) {
    threw = true;
    assert(e.Object() == "DOCDATA.COLUMNS");
    assert((e.Blockers() == std::vector<std::string>{"view APP.COLUMN_NOTES"}));
  }
  assert(threw);

  // nothing was torn down
  assert(app.deployment->IsInstalled());
  assert(app.introspector->TypeOf({"DOCCAT", "TABLES"}) == catalog::SchemaObjectType::kView);
  assert(app.introspector->TypeOf({"DOCCAT", "TABLES_SYNC"}) == catalog::SchemaObjectType::kTrigger);
  assert(app.catalog->TriggersIn("DOCCAT").size() == catalog::AllKinds().size());
}

void TestBadExtendedShapeLeavesNothingBehind() {
  auto app = SeededApplication();
  app.db->Exec(R"(CREATE TABLE "SYSCAT.NOTES" ("NAME" VARCHAR(128), "REMARKS" VARCHAR(254)))");
  app.db->Exec(R"(CREATE TABLE "DOCDATA.NOTES" ("NAME" VARCHAR(128), "REMARKS" CLOB))");

  bool threw = false;
  try {
    (void)app.deployment->Setup();
  } catch (const util::KeyShapeViolation&) {
    threw = true;
  }
  assert(threw);

  assert(!app.deployment->IsInstalled());
  assert(!app.catalog->SchemaExists("DOCDATA"));
  assert(app.introspector->ObjectsIn("DOCCAT").empty());
  assert((app.introspector->TablesIn("DOCDATA") == std::vector<std::string>{"NOTES"}));
}

void TestRestrictedDropOfReferencedTable() {
  auto app = SeededApplication();
  (void)app.deployment->Setup();

  bool threw = false;
  try {
    app.executor->Execute(ddl::DropObject{ddl::ObjectType::kTable, app.layout.Extended("TABLES")});
  } catch (const util::TeardownBlocked& e) {
    threw = true;
    assert(e.Blockers().size() == 2);
  }
  assert(threw);
  assert(app.introspector->TableExists(app.layout.Extended("TABLES")));
}

} // namespace

int main() {
  TestSetupCreatesMergedNamespace();
  TestMergedReadPrefersExtendedComment();
  TestTriggerRoundTrip();
  TestTriggerFillsRoutineParameterDefaults();
  TestUninstallRightAfterInstall();
  TestSetupRemoveSetup();
  TestSetupTwiceIsRejected();
  TestRemoveIsBlockedByForeignDependents();
  TestBadExtendedShapeLeavesNothingBehind();
  TestRestrictedDropOfReferencedTable();

  std::cout << "doccat_integration_install: pass\n";
  return 0;
}
