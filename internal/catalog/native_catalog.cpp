#include "internal/catalog/native_catalog.hpp"

#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/utf8.hpp"

namespace doccat::catalog {

using db::sqlite::SqliteStatement;

namespace {

struct NativeColumn {
  std::string_view name;
  std::string_view type;
};

struct NativeTable {
  std::string_view              name;
  std::vector<NativeColumn>     columns;
  std::vector<std::string_view> unique_key;
};

constexpr NativeColumn kRemarks{"REMARKS", "VARCHAR(254)"};

const std::vector<NativeTable>& NativeTables() {
  static const std::vector<NativeTable> tables = {
      {"DATATYPES",
       {{"TYPESCHEMA", "VARCHAR(128)"},
        {"TYPENAME", "VARCHAR(128)"},
        {"OWNER", "VARCHAR(128)"},
        {"METATYPE", "CHAR(1)"},
        {"LENGTH", "INTEGER"},
        kRemarks},
       {"TYPESCHEMA", "TYPENAME"}},
      {"COLUMNS",
       {{"TABSCHEMA", "VARCHAR(128)"},
        {"TABNAME", "VARCHAR(128)"},
        {"COLNAME", "VARCHAR(128)"},
        {"COLNO", "SMALLINT"},
        {"TYPENAME", "VARCHAR(128)"},
        {"LENGTH", "INTEGER"},
        {"NULLS", "CHAR(1)"},
        kRemarks},
       {"TABSCHEMA", "TABNAME", "COLNAME"}},
      {"TABCONST",
       {{"CONSTNAME", "VARCHAR(128)"},
        {"TABSCHEMA", "VARCHAR(128)"},
        {"TABNAME", "VARCHAR(128)"},
        {"TYPE", "CHAR(1)"},
        kRemarks},
       {"TABSCHEMA", "TABNAME", "CONSTNAME"}},
      {"INDEXES",
       {{"INDSCHEMA", "VARCHAR(128)"},
        {"INDNAME", "VARCHAR(128)"},
        {"TABSCHEMA", "VARCHAR(128)"},
        {"TABNAME", "VARCHAR(128)"},
        {"UNIQUERULE", "CHAR(1)"},
        kRemarks},
       {"INDSCHEMA", "INDNAME"}},
      {"ROUTINES",
       {{"ROUTINESCHEMA", "VARCHAR(128)"},
        {"SPECIFICNAME", "VARCHAR(128)"},
        {"ROUTINENAME", "VARCHAR(128)"},
        {"ROUTINETYPE", "CHAR(1)"},
        {"LANGUAGE", "VARCHAR(8)"},
        kRemarks},
       {"ROUTINESCHEMA", "SPECIFICNAME"}},
      {"ROUTINEPARMS",
       {{"ROUTINESCHEMA", "VARCHAR(128)"},
        {"SPECIFICNAME", "VARCHAR(128)"},
        {"PARMNAME", "VARCHAR(128)"},
        {"ROWTYPE", "CHAR(1)"},
        {"ORDINAL", "SMALLINT"},
        {"TYPENAME", "VARCHAR(128)"},
        kRemarks},
       {"ROUTINESCHEMA", "SPECIFICNAME", "ROWTYPE", "ORDINAL"}},
      {"SCHEMATA", {{"SCHEMANAME", "VARCHAR(128)"}, {"OWNER", "VARCHAR(128)"}, kRemarks}, {"SCHEMANAME"}},
      {"TABLES",
       {{"TABSCHEMA", "VARCHAR(128)"},
        {"TABNAME", "VARCHAR(128)"},
        {"TYPE", "CHAR(1)"},
        {"TBSPACE", "VARCHAR(128)"},
        kRemarks},
       {"TABSCHEMA", "TABNAME"}},
      {"TRIGGERS",
       {{"TRIGSCHEMA", "VARCHAR(128)"},
        {"TRIGNAME", "VARCHAR(128)"},
        {"TABSCHEMA", "VARCHAR(128)"},
        {"TABNAME", "VARCHAR(128)"},
        {"TRIGTIME", "CHAR(1)"},
        {"TRIGEVENT", "CHAR(1)"},
        kRemarks},
       {"TRIGSCHEMA", "TRIGNAME"}},
      {"TABLESPACES", {{"TBSPACE", "VARCHAR(128)"}, {"DATATYPE", "CHAR(1)"}, kRemarks}, {"TBSPACE"}},
      // no extended tables for these two; install aliases them
      {"SEQUENCES",
       {{"SEQSCHEMA", "VARCHAR(128)"}, {"SEQNAME", "VARCHAR(128)"}, {"INCREMENT", "BIGINT"}, kRemarks},
       {"SEQSCHEMA", "SEQNAME"}},
      {"REFERENCES",
       {{"CONSTNAME", "VARCHAR(128)"},
        {"TABSCHEMA", "VARCHAR(128)"},
        {"TABNAME", "VARCHAR(128)"},
        {"REFTABSCHEMA", "VARCHAR(128)"},
        {"REFTABNAME", "VARCHAR(128)"},
        {"REFKEYNAME", "VARCHAR(128)"}},
       {"TABSCHEMA", "TABNAME", "CONSTNAME"}},
  };
  return tables;
}

std::string CreateSql(const QualifiedName& name, const NativeTable& table) {
  std::string sql = "CREATE TABLE IF NOT EXISTS " + name.Quoted() + " (";
  for (const auto& column : table.columns) {
    sql += QuoteIdentifier(column.name) + " " + std::string(column.type);
    if (column.name == kCommentColumn) {
      sql += " CHECK (length(" + QuoteIdentifier(column.name) + ") <= " + std::to_string(kNativeCommentLimit) + ")";
    }
    sql += ", ";
  }
  sql += "UNIQUE (";
  for (std::size_t i = 0; i < table.unique_key.size(); ++i) {
    if (i > 0) sql += ", ";
    sql += QuoteIdentifier(table.unique_key[i]);
  }
  sql += "))";
  return sql;
}

std::string KeyPredicate(const std::vector<std::string>& key_columns, int first_param) {
  std::string predicate;
  for (std::size_t i = 0; i < key_columns.size(); ++i) {
    if (i > 0) predicate += " AND ";
    predicate += QuoteIdentifier(key_columns[i]) + " = ?" + std::to_string(first_param + static_cast<int>(i));
  }
  return predicate;
}

void CheckArity(const KindSpec& kind, const std::vector<std::string>& key) {
  if (key.size() != kind.key_columns.size()) {
    throw util::InvalidArgument(kind.table + " expects " + std::to_string(kind.key_columns.size()) +
                                " key parts, got " + std::to_string(key.size()));
  }
}

} // namespace

NativeCatalog::NativeCatalog(std::shared_ptr<db::sqlite::SqliteDB> db, std::string ns)
    : db_(std::move(db)), ns_(std::move(ns)) {
}

void NativeCatalog::Bootstrap() {
  for (const auto& table : NativeTables()) {
    db_->Exec(CreateSql(Table(table.name), table));
  }

  Exec("INSERT OR IGNORE INTO " + Table("SCHEMATA").Quoted() + " (\"SCHEMANAME\", \"OWNER\") VALUES (?1, 'SYSIBM')",
       {ns_});

  for (const auto& table : NativeTables()) {
    Exec("INSERT OR IGNORE INTO " + Table("TABLES").Quoted() +
             " (\"TABSCHEMA\", \"TABNAME\", \"TYPE\") VALUES (?1, ?2, 'T')",
         {ns_, table.name});

    int colno = 0;
    for (const auto& column : table.columns) {
      SqliteStatement stmt(db_->Handle(), "INSERT OR IGNORE INTO " + Table("COLUMNS").Quoted() +
                                              " (\"TABSCHEMA\", \"TABNAME\", \"COLNAME\", \"COLNO\", "
                                              "\"TYPENAME\", \"NULLS\") VALUES (?1, ?2, ?3, ?4, ?5, 'Y')");
      stmt.BindText(1, ns_);
      stmt.BindText(2, table.name);
      stmt.BindText(3, column.name);
      stmt.BindInt64(4, colno++);
      stmt.BindText(5, column.type);
      stmt.Step();
    }
  }

  DOCCAT_LOG_DEBUG("native catalog ready", {observability::StringField("namespace", ns_)});
}

bool NativeCatalog::SchemaExists(std::string_view schema) const {
  SqliteStatement stmt(db_->Handle(),
                       "SELECT 1 FROM " + Table("SCHEMATA").Quoted() + " WHERE \"SCHEMANAME\" = ?1");
  stmt.BindText(1, schema);
  return stmt.Step();
}

void NativeCatalog::RegisterSchema(std::string_view schema) {
  Exec("INSERT INTO " + Table("SCHEMATA").Quoted() + " (\"SCHEMANAME\", \"OWNER\") VALUES (?1, 'DOCCAT')",
       {schema});
}

void NativeCatalog::UnregisterSchema(std::string_view schema) {
  Exec("DELETE FROM " + Table("SCHEMATA").Quoted() + " WHERE \"SCHEMANAME\" = ?1", {schema});
}

void NativeCatalog::RegisterTable(const QualifiedName& table, TableType type, const std::vector<ColumnInfo>& columns) {
  std::string type_code(1, static_cast<char>(type));

  // recreating an object keeps an existing comment
  Exec("INSERT INTO " + Table("TABLES").Quoted() +
           " (\"TABSCHEMA\", \"TABNAME\", \"TYPE\") VALUES (?1, ?2, ?3) "
           "ON CONFLICT (\"TABSCHEMA\", \"TABNAME\") DO UPDATE SET \"TYPE\" = excluded.\"TYPE\"",
       {table.schema, table.name, type_code});

  for (const auto& column : columns) {
    SqliteStatement stmt(db_->Handle(),
                         "INSERT INTO " + Table("COLUMNS").Quoted() +
                             " (\"TABSCHEMA\", \"TABNAME\", \"COLNAME\", \"COLNO\", \"TYPENAME\", \"NULLS\") "
                             "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
                             "ON CONFLICT (\"TABSCHEMA\", \"TABNAME\", \"COLNAME\") DO UPDATE SET "
                             "\"COLNO\" = excluded.\"COLNO\", \"TYPENAME\" = excluded.\"TYPENAME\", "
                             "\"NULLS\" = excluded.\"NULLS\"");
    stmt.BindText(1, table.schema);
    stmt.BindText(2, table.name);
    stmt.BindText(3, column.name);
    stmt.BindInt64(4, column.position);
    stmt.BindText(5, column.declared_type);
    stmt.BindText(6, column.not_null ? "N" : "Y");
    stmt.Step();
  }
}

void NativeCatalog::UnregisterTable(const QualifiedName& table) {
  Exec("DELETE FROM " + Table("COLUMNS").Quoted() + " WHERE \"TABSCHEMA\" = ?1 AND \"TABNAME\" = ?2",
       {table.schema, table.name});
  Exec("DELETE FROM " + Table("TABLES").Quoted() + " WHERE \"TABSCHEMA\" = ?1 AND \"TABNAME\" = ?2",
       {table.schema, table.name});
}

std::vector<std::string> NativeCatalog::TablesOfType(std::string_view schema, TableType type) const {
  SqliteStatement stmt(db_->Handle(), "SELECT \"TABNAME\" FROM " + Table("TABLES").Quoted() +
                                          " WHERE \"TABSCHEMA\" = ?1 AND \"TYPE\" = ?2 ORDER BY \"TABNAME\"");
  stmt.BindText(1, schema);
  stmt.BindText(2, std::string(1, static_cast<char>(type)));

  std::vector<std::string> names;
  while (stmt.Step()) {
    names.push_back(stmt.ColumnText(0));
  }
  return names;
}

void NativeCatalog::RegisterTrigger(const QualifiedName& trigger, const QualifiedName& subject) {
  // INSTEAD OF ('I') UPDATE ('U')
  Exec("INSERT INTO " + Table("TRIGGERS").Quoted() +
           " (\"TRIGSCHEMA\", \"TRIGNAME\", \"TABSCHEMA\", \"TABNAME\", \"TRIGTIME\", \"TRIGEVENT\") "
           "VALUES (?1, ?2, ?3, ?4, 'I', 'U') "
           "ON CONFLICT (\"TRIGSCHEMA\", \"TRIGNAME\") DO UPDATE SET "
           "\"TABSCHEMA\" = excluded.\"TABSCHEMA\", \"TABNAME\" = excluded.\"TABNAME\"",
       {trigger.schema, trigger.name, subject.schema, subject.name});
}

void NativeCatalog::UnregisterTrigger(const QualifiedName& trigger) {
  Exec("DELETE FROM " + Table("TRIGGERS").Quoted() + " WHERE \"TRIGSCHEMA\" = ?1 AND \"TRIGNAME\" = ?2",
       {trigger.schema, trigger.name});
}

std::vector<std::string> NativeCatalog::TriggersIn(std::string_view schema) const {
  SqliteStatement stmt(db_->Handle(), "SELECT \"TRIGNAME\" FROM " + Table("TRIGGERS").Quoted() +
                                          " WHERE \"TRIGSCHEMA\" = ?1 ORDER BY \"TRIGNAME\"");
  stmt.BindText(1, schema);

  std::vector<std::string> names;
  while (stmt.Step()) {
    names.push_back(stmt.ColumnText(0));
  }
  return names;
}

void NativeCatalog::RegisterRoutine(const RoutineEntry& routine) {
  std::string type_code(1, routine.routine_type);
  Exec("INSERT INTO " + Table("ROUTINES").Quoted() +
           " (\"ROUTINESCHEMA\", \"SPECIFICNAME\", \"ROUTINENAME\", \"ROUTINETYPE\", \"LANGUAGE\") "
           "VALUES (?1, ?2, ?3, ?4, ?5)",
       {routine.specific.schema, routine.specific.name, routine.routine_name, type_code, routine.language});

  int ordinal = 1;
  for (const auto& parameter : routine.parameters) {
    SqliteStatement stmt(db_->Handle(),
                         "INSERT INTO " + Table("ROUTINEPARMS").Quoted() +
                             " (\"ROUTINESCHEMA\", \"SPECIFICNAME\", \"PARMNAME\", \"ROWTYPE\", \"ORDINAL\", "
                             "\"TYPENAME\") VALUES (?1, ?2, ?3, 'P', ?4, 'VARCHAR')");
    stmt.BindText(1, routine.specific.schema);
    stmt.BindText(2, routine.specific.name);
    stmt.BindText(3, parameter);
    stmt.BindInt64(4, ordinal++);
    stmt.Step();
  }
}

void NativeCatalog::UnregisterRoutine(const QualifiedName& specific) {
  Exec("DELETE FROM " + Table("ROUTINEPARMS").Quoted() +
           " WHERE \"ROUTINESCHEMA\" = ?1 AND \"SPECIFICNAME\" = ?2",
       {specific.schema, specific.name});
  Exec("DELETE FROM " + Table("ROUTINES").Quoted() + " WHERE \"ROUTINESCHEMA\" = ?1 AND \"SPECIFICNAME\" = ?2",
       {specific.schema, specific.name});
}

bool NativeCatalog::RoutineExists(const QualifiedName& specific) const {
  SqliteStatement stmt(db_->Handle(), "SELECT 1 FROM " + Table("ROUTINES").Quoted() +
                                          " WHERE \"ROUTINESCHEMA\" = ?1 AND \"SPECIFICNAME\" = ?2");
  stmt.BindText(1, specific.schema);
  stmt.BindText(2, specific.name);
  return stmt.Step();
}

std::vector<std::string> NativeCatalog::RoutinesIn(std::string_view schema) const {
  SqliteStatement stmt(db_->Handle(), "SELECT \"SPECIFICNAME\" FROM " + Table("ROUTINES").Quoted() +
                                          " WHERE \"ROUTINESCHEMA\" = ?1 ORDER BY \"SPECIFICNAME\"");
  stmt.BindText(1, schema);

  std::vector<std::string> names;
  while (stmt.Step()) {
    names.push_back(stmt.ColumnText(0));
  }
  return names;
}

std::size_t NativeCatalog::SetRemarks(const KindSpec& kind, const std::string& target,
                                      const std::vector<std::string>& key,
                                      const std::optional<std::string>& text) {
  CheckArity(kind, key);

  std::optional<std::string> value = text;
  if (value && value->empty()) value.reset();

  if (value && util::Utf8Length(*value) > kNativeCommentLimit) {
    throw util::InvalidArgument("comment on " + kind.table + " exceeds " + std::to_string(kNativeCommentLimit) +
                                " characters");
  }

  int         discriminator_param = static_cast<int>(key.size()) + 2;
  std::string sql = "UPDATE " + Table(kind.table).Quoted() + " SET " + QuoteIdentifier(kCommentColumn) +
                    " = ?1 WHERE " + KeyPredicate(kind.key_columns, 2);
  if (!kind.discriminator_column.empty()) {
    std::string column = QuoteIdentifier(kind.discriminator_column);
    if (target == kind.discriminated_target) {
      sql += " AND " + column + " = ?" + std::to_string(discriminator_param);
    } else {
      sql += " AND COALESCE(" + column + ", '') <> ?" + std::to_string(discriminator_param);
    }
  }

  SqliteStatement stmt(db_->Handle(), sql);
  stmt.BindOptionalText(1, value);
  for (std::size_t i = 0; i < key.size(); ++i) {
    stmt.BindText(static_cast<int>(i) + 2, key[i]);
  }
  if (!kind.discriminator_column.empty()) {
    stmt.BindText(discriminator_param, kind.discriminator_value);
  }
  stmt.Step();

  return static_cast<std::size_t>(sqlite3_changes(db_->Handle()));
}

std::optional<std::string> NativeCatalog::RemarksOf(const KindSpec& kind, const std::vector<std::string>& key) const {
  CheckArity(kind, key);

  SqliteStatement stmt(db_->Handle(), "SELECT " + QuoteIdentifier(kCommentColumn) + " FROM " +
                                          Table(kind.table).Quoted() + " WHERE " +
                                          KeyPredicate(kind.key_columns, 1));
  for (std::size_t i = 0; i < key.size(); ++i) {
    stmt.BindText(static_cast<int>(i) + 1, key[i]);
  }
  if (!stmt.Step()) return std::nullopt;
  return stmt.ColumnOptionalText(0);
}

void NativeCatalog::Exec(const std::string& sql, std::initializer_list<std::string_view> params) {
  SqliteStatement stmt(db_->Handle(), sql);
  int             idx = 1;
  for (auto param : params) {
    stmt.BindText(idx++, param);
  }
  stmt.Step();
}

} // namespace doccat::catalog
