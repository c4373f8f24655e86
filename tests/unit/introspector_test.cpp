#include "internal/catalog/introspector.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/ddl/kind_template.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace doccat;

namespace {

std::shared_ptr<db::sqlite::SqliteDB> OpenDb() {
  db::sqlite::SqliteOptions options;
  options.wal_mode = false;
  return std::make_shared<db::sqlite::SqliteDB>(":memory:", options);
}

void TestColumnsFollowDeclaredOrderAndKeyOrder() {
  auto db = OpenDb();
  db->Exec(R"sql(CREATE TABLE "X.T" ("A" TEXT NOT NULL DEFAULT '', "B" TEXT NOT NULL, "C" TEXT,
                 PRIMARY KEY ("B", "A")))sql");

  catalog::Introspector introspector(db);
  auto                  columns = introspector.ColumnsOf({"X", "T"});
  assert(columns.size() == 3);
  assert(columns[0].name == "A" && columns[0].position == 0);
  assert(columns[0].key_position == 2);
  assert(columns[0].DefaultsToEmptyString());
  assert(columns[0].not_null);
  assert(columns[1].key_position == 1);
  assert(!columns[1].DefaultsToEmptyString());
  assert(!columns[2].IsKey());

  assert((introspector.KeyColumnsOf({"X", "T"}) == std::vector<std::string>{"B", "A"}));
}

void TestExistenceAndNamespaces() {
  auto db = OpenDb();
  db->Exec(R"sql(
CREATE TABLE "X.T1" ("A" TEXT);
CREATE TABLE "X.T2" ("A" TEXT);
CREATE TABLE "XY.T3" ("A" TEXT);
CREATE VIEW "X.V" AS SELECT "A" FROM "X.T1";
)sql");

  catalog::Introspector introspector(db);
  assert(introspector.TableExists({"X", "T1"}));
  assert(introspector.TableExists({"X", "V"}));
  assert(!introspector.TableExists({"X", "MISSING"}));
  assert(introspector.TypeOf({"X", "V"}) == catalog::SchemaObjectType::kView);

  // XY.T3 shares a prefix but not the namespace
  assert((introspector.TablesIn("X") == std::vector<std::string>{"T1", "T2"}));
  assert(introspector.ObjectsIn("X").size() == 3);
  assert(introspector.ObjectsIn("NOPE").empty());

  bool threw = false;
  try {
    (void)introspector.ColumnsOf({"X", "MISSING"});
  } catch (const util::MetadataNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestNonAsciiNamespaces() {
  auto db = OpenDb();
  db->Exec(R"sql(
CREATE TABLE "DOKÜ.TABLES" ("A" TEXT);
CREATE VIEW "DOKÜ.V" AS SELECT "A" FROM "DOKÜ.TABLES";
CREATE TABLE "DOKÜX.T" ("A" TEXT);
CREATE TABLE "DOK.T" ("A" TEXT);
)sql");

  // prefixes are compared in characters, not bytes
  catalog::Introspector introspector(db);
  assert((introspector.TablesIn("DOKÜ") == std::vector<std::string>{"TABLES"}));
  assert(introspector.ObjectsIn("DOKÜ").size() == 2);
  assert((introspector.TablesIn("DOK") == std::vector<std::string>{"T"}));
}

void TestDependentsMatchWholeNames() {
  auto db = OpenDb();
  db->Exec(R"sql(
CREATE TABLE "X.TABLES" ("A" TEXT);
CREATE TABLE "X.TABLESPACES" ("A" TEXT);
CREATE VIEW "Y.OVER_SPACES" AS SELECT "A" FROM "X.TABLESPACES";
CREATE VIEW "Y.OVER_TABLES" AS SELECT "A" FROM "X.TABLES";
)sql");

  catalog::Introspector introspector(db);
  auto                  dependents = introspector.DependentsOf({"X", "TABLES"});
  assert(dependents.size() == 1);
  assert(dependents[0].Describe() == "view Y.OVER_TABLES");
  assert(introspector.DependentsOf({"Y", "OVER_TABLES"}).empty());
}

void TestKindTemplateReadsLiveMetadata() {
  auto db = OpenDb();
  db->Exec(R"sql(
CREATE TABLE "SYSCAT.ROUTINEPARMS" ("ROUTINESCHEMA" TEXT, "SPECIFICNAME" TEXT, "PARMNAME" TEXT, "ROWTYPE" TEXT,
                                    "ORDINAL" INTEGER, "TYPENAME" TEXT, "REMARKS" TEXT);
CREATE TABLE "DOCDATA.ROUTINEPARMS" ("ROUTINESCHEMA" TEXT NOT NULL DEFAULT '', "SPECIFICNAME" TEXT NOT NULL DEFAULT '',
                                     "ROWTYPE" TEXT NOT NULL, "ORDINAL" INTEGER NOT NULL, "PARMNAME" TEXT,
                                     "REMARKS" TEXT,
                                     PRIMARY KEY ("ROUTINESCHEMA", "SPECIFICNAME", "ROWTYPE", "ORDINAL"));
)sql");

  catalog::Introspector introspector(db);
  auto tmpl = ddl::BuildKindTemplate(introspector, catalog::NamespaceLayout{}, "ROUTINEPARMS");

  assert(tmpl.native_columns.size() == 7);
  assert(tmpl.HasCommentColumn());
  assert(tmpl.HasNativeColumn("ROWTYPE"));
  assert(!tmpl.HasNativeColumn("ROUTINETYPE"));
  assert(tmpl.keys.size() == 4);
  assert(tmpl.keys[0].source == ddl::ValueSource::kEmptyIfNull);
  assert(tmpl.keys[2].source == ddl::ValueSource::kDirect);
  assert(tmpl.carried.size() == 1);
  assert(tmpl.carried[0].column == "PARMNAME");
  assert(tmpl.carried[0].source == ddl::ValueSource::kSynthesizedName);
}

template <typename Error>
bool TemplateThrows(const std::string& ddl_sql) {
  auto db = OpenDb();
  db->Exec(ddl_sql);
  catalog::Introspector introspector(db);
  try {
    (void)ddl::BuildKindTemplate(introspector, catalog::NamespaceLayout{}, "SCHEMATA");
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestKindTemplateRejectsBadShapes() {
  // no primary key
  assert(TemplateThrows<util::KeyShapeViolation>(R"sql(
CREATE TABLE "SYSCAT.SCHEMATA" ("SCHEMANAME" TEXT, "REMARKS" TEXT);
CREATE TABLE "DOCDATA.SCHEMATA" ("SCHEMANAME" TEXT, "REMARKS" TEXT);
)sql"));

  // key column unknown to the native table
  assert(TemplateThrows<util::KeyShapeViolation>(R"sql(
CREATE TABLE "SYSCAT.SCHEMATA" ("SCHEMANAME" TEXT, "REMARKS" TEXT);
CREATE TABLE "DOCDATA.SCHEMATA" ("NAME" TEXT PRIMARY KEY, "REMARKS" TEXT);
)sql"));

  // extended table without a comment column
  assert(TemplateThrows<util::MetadataNotFound>(R"sql(
CREATE TABLE "SYSCAT.SCHEMATA" ("SCHEMANAME" TEXT, "REMARKS" TEXT);
CREATE TABLE "DOCDATA.SCHEMATA" ("SCHEMANAME" TEXT PRIMARY KEY);
)sql"));

  // missing native table
  assert(TemplateThrows<util::MetadataNotFound>(R"sql(
CREATE TABLE "DOCDATA.SCHEMATA" ("SCHEMANAME" TEXT PRIMARY KEY, "REMARKS" TEXT);
)sql"));
}

} // namespace

int main() {
  TestColumnsFollowDeclaredOrderAndKeyOrder();
  TestExistenceAndNamespaces();
  TestNonAsciiNamespaces();
  TestDependentsMatchWholeNames();
  TestKindTemplateReadsLiveMetadata();
  TestKindTemplateRejectsBadShapes();

  std::cout << "doccat_unit_introspector: pass\n";
  return 0;
}
