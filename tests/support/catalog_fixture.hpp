#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/factory.hpp"

namespace doccat::testing {

// In-memory database with the native catalog bootstrapped and default namespaces.
inline factory::Application MakeApplication(bool import_on_setup = false) {
  db::sqlite::SqliteOptions options;
  options.wal_mode = false;
  auto db          = std::make_shared<db::sqlite::SqliteDB>(":memory:", options);
  return factory::Build(std::move(db), catalog::NamespaceLayout{}, import_on_setup);
}

// A small application schema described in the native catalog.
inline void SeedNativeCatalog(db::sqlite::SqliteDB& db) {
  db.Exec(R"sql(
INSERT INTO "SYSCAT.SCHEMATA" ("SCHEMANAME", "OWNER", "REMARKS") VALUES ('APP', 'ALICE', 'Application schema');
INSERT INTO "SYSCAT.TABLESPACES" ("TBSPACE", "DATATYPE", "REMARKS") VALUES ('USERSPACE1', 'A', 'Default user space');
INSERT INTO "SYSCAT.TABLES" ("TABSCHEMA", "TABNAME", "TYPE", "TBSPACE", "REMARKS") VALUES
  ('APP', 'ORDERS', 'T', 'USERSPACE1', 'Customer orders'),
  ('APP', 'ITEMS', 'T', 'USERSPACE1', NULL);
INSERT INTO "SYSCAT.COLUMNS" ("TABSCHEMA", "TABNAME", "COLNAME", "COLNO", "TYPENAME", "NULLS", "REMARKS") VALUES
  ('APP', 'ORDERS', 'ID', 0, 'INTEGER', 'N', 'Order number'),
  ('APP', 'ORDERS', 'NOTE', 1, 'VARCHAR', 'Y', NULL);
INSERT INTO "SYSCAT.TABCONST" ("CONSTNAME", "TABSCHEMA", "TABNAME", "TYPE", "REMARKS") VALUES
  ('PK_ORDERS', 'APP', 'ORDERS', 'P', NULL);
INSERT INTO "SYSCAT.ROUTINES" ("ROUTINESCHEMA", "SPECIFICNAME", "ROUTINENAME", "ROUTINETYPE", "LANGUAGE", "REMARKS") VALUES
  ('APP', 'PURGE_V1', 'PURGE', 'P', 'SQL', 'Purges old orders'),
  ('APP', 'TOTAL_V1', 'TOTAL', 'F', 'SQL', NULL);
INSERT INTO "SYSCAT.ROUTINEPARMS" ("ROUTINESCHEMA", "SPECIFICNAME", "PARMNAME", "ROWTYPE", "ORDINAL", "TYPENAME", "REMARKS") VALUES
  ('APP', 'PURGE_V1', NULL, 'P', 1, 'INTEGER', 'Days to keep'),
  (NULL, NULL, 'X', 'P', 2, 'INTEGER', 'Orphan parameter');
INSERT INTO "SYSCAT.SEQUENCES" ("SEQSCHEMA", "SEQNAME", "INCREMENT", "REMARKS") VALUES ('APP', 'ORDER_SEQ', 1, 'Order numbers');
)sql");
}

inline std::optional<std::string> QueryText(db::sqlite::SqliteDB& db, const std::string& sql) {
  db::sqlite::SqliteStatement stmt(db.Handle(), sql);
  if (!stmt.Step()) return std::nullopt;
  return stmt.ColumnOptionalText(0);
}

inline std::int64_t QueryInt(db::sqlite::SqliteDB& db, const std::string& sql) {
  db::sqlite::SqliteStatement stmt(db.Handle(), sql);
  stmt.Step();
  return stmt.ColumnInt64(0);
}

} // namespace doccat::testing
