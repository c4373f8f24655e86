#include "internal/store/extended_store.hpp"

#include "internal/catalog/object_kind.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace doccat::store {

using catalog::QuoteIdentifier;
using db::ErrorCode;
using db::Result;
using db::sqlite::SqliteStatement;
using db::sqlite::SqliteTransaction;

namespace {

SqliteTransaction& TX(db::Transaction& tx) {
  return static_cast<SqliteTransaction&>(tx);
}

std::string KeyPredicate(const std::vector<std::string>& columns) {
  std::string predicate;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) predicate += " AND ";
    predicate += QuoteIdentifier(columns[i]) + " = ?" + std::to_string(i + 1);
  }
  return predicate;
}

void BindKey(SqliteStatement& stmt, const KeyValues& key) {
  for (std::size_t i = 0; i < key.size(); ++i) {
    stmt.BindText(static_cast<int>(i) + 1, key[i]);
  }
}

} // namespace

ExtendedStore::ExtendedStore(std::shared_ptr<db::sqlite::SqliteDB> db,
                             std::shared_ptr<catalog::Introspector> introspector, catalog::NamespaceLayout layout)
    : db_(std::move(db)), introspector_(std::move(introspector)), layout_(std::move(layout)) {
}

std::unique_ptr<db::Transaction> ExtendedStore::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

std::vector<ddl::Statement> ExtendedStore::PlanCreateTables() const {
  std::vector<ddl::Statement> plan;
  for (const auto& kind : catalog::AllKinds()) {
    ddl::CreateTable table;
    table.table       = layout_.Extended(kind.table);
    table.columns     = kind.extended_columns;
    table.primary_key = kind.key_columns;
    plan.emplace_back(std::move(table));
  }
  return plan;
}

bool ExtendedStore::HasTable(std::string_view kind_table) const {
  return introspector_->TableExists(layout_.Extended(kind_table));
}

Result ExtendedStore::ApplyComment(db::Transaction& tx, std::string_view kind_table, const KeyValues& key,
                                   const std::optional<std::string>& comment, ddl::CommentAction& applied) {
  if (!HasTable(kind_table)) {
    return Result::Err(ErrorCode::NotFound, "no extended table for " + std::string(kind_table));
  }

  auto* db      = TX(tx).Handle();
  auto  columns = KeyColumns(kind_table, key);
  auto  table   = layout_.Extended(kind_table).Quoted();
  auto  comment_column = QuoteIdentifier(catalog::kCommentColumn);
  int   comment_param  = static_cast<int>(key.size()) + 1;

  bool row_exists = false;
  {
    SqliteStatement probe(db, "SELECT 1 FROM " + table + " WHERE " + KeyPredicate(columns));
    BindKey(probe, key);
    row_exists = probe.Step();
  }

  bool new_is_null = ddl::IsAbsent(comment ? std::optional<std::string_view>(*comment) : std::nullopt);
  applied          = ddl::Transition(row_exists, new_is_null);

  std::string sql;
  switch (applied) {
    case ddl::CommentAction::kNoop:
      return Result::Ok();
    case ddl::CommentAction::kDelete:
      sql = "DELETE FROM " + table + " WHERE " + KeyPredicate(columns);
      break;
    case ddl::CommentAction::kUpdate:
      sql = "UPDATE " + table + " SET " + comment_column + " = ?" + std::to_string(comment_param) + " WHERE " +
            KeyPredicate(columns);
      break;
    case ddl::CommentAction::kInsert: {
      std::string names;
      std::string params;
      for (std::size_t i = 0; i < columns.size(); ++i) {
        names += QuoteIdentifier(columns[i]) + ", ";
        params += "?" + std::to_string(i + 1) + ", ";
      }
      sql = "INSERT INTO " + table + " (" + names + comment_column + ") VALUES (" + params + "?" +
            std::to_string(comment_param) + ")";
      break;
    }
  }

  SqliteStatement stmt(db, sql);
  BindKey(stmt, key);
  if (applied != ddl::CommentAction::kDelete) {
    stmt.BindText(comment_param, *comment);
  }

  int rc = stmt.StepCode();
  DOCCAT_LOG_DEBUG("extended comment written", {observability::StringField("kind", kind_table),
                                                observability::StringField("action", ddl::ActionName(applied))});
  return Translate(db, rc);
}

std::optional<std::string> ExtendedStore::GetComment(db::Transaction& tx, std::string_view kind_table,
                                                     const KeyValues& key) {
  auto columns = KeyColumns(kind_table, key);

  SqliteStatement stmt(TX(tx).Handle(), "SELECT " + QuoteIdentifier(catalog::kCommentColumn) + " FROM " +
                                            layout_.Extended(kind_table).Quoted() + " WHERE " +
                                            KeyPredicate(columns));
  BindKey(stmt, key);
  if (!stmt.Step()) return std::nullopt;
  return stmt.ColumnOptionalText(0);
}

std::size_t ExtendedStore::CountRows(db::Transaction& tx, std::string_view kind_table) {
  SqliteStatement stmt(TX(tx).Handle(), "SELECT COUNT(*) FROM " + layout_.Extended(kind_table).Quoted());
  stmt.Step();
  return static_cast<std::size_t>(stmt.ColumnInt64(0));
}

Result ExtendedStore::CopyRoutineComments(db::Transaction& tx, const std::string& schema,
                                          const std::string& old_specific, const std::string& new_specific) {
  return CopyByRoutine(tx, "ROUTINES", schema, old_specific, new_specific);
}

Result ExtendedStore::CopyRoutineParameterComments(db::Transaction& tx, const std::string& schema,
                                                   const std::string& old_specific,
                                                   const std::string& new_specific) {
  return CopyByRoutine(tx, "ROUTINEPARMS", schema, old_specific, new_specific);
}

Result ExtendedStore::CopyByRoutine(db::Transaction& tx, std::string_view kind_table, const std::string& schema,
                                    const std::string& old_specific, const std::string& new_specific) {
  if (!HasTable(kind_table)) {
    return Result::Err(ErrorCode::NotFound, "no extended table for " + std::string(kind_table));
  }
  if (old_specific == new_specific) return Result::Ok();

  auto* db    = TX(tx).Handle();
  auto  table = layout_.Extended(kind_table);

  // every column but the routine key is copied as is
  std::string copied;
  for (const auto& column : introspector_->ColumnsOf(table)) {
    if (column.name == "ROUTINESCHEMA" || column.name == "SPECIFICNAME") continue;
    copied += ", " + QuoteIdentifier(column.name);
  }

  SqliteTransaction inner(db_);

  {
    SqliteStatement del(db, "DELETE FROM " + table.Quoted() +
                                " WHERE \"ROUTINESCHEMA\" = ?1 AND \"SPECIFICNAME\" = ?2");
    del.BindText(1, schema);
    del.BindText(2, new_specific);
    int rc = del.StepCode();
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }

  SqliteStatement ins(db, "INSERT INTO " + table.Quoted() + " (\"ROUTINESCHEMA\", \"SPECIFICNAME\"" + copied +
                              ") SELECT \"ROUTINESCHEMA\", ?3" + copied + " FROM " + table.Quoted() +
                              " WHERE \"ROUTINESCHEMA\" = ?1 AND \"SPECIFICNAME\" = ?2");
  ins.BindText(1, schema);
  ins.BindText(2, old_specific);
  ins.BindText(3, new_specific);
  int rc = ins.StepCode();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  int rows = sqlite3_changes(db);

  inner.Commit();
  DOCCAT_LOG_INFO("routine comments copied",
                  {observability::StringField("kind", kind_table), observability::StringField("schema", schema),
                   observability::StringField("from", old_specific), observability::StringField("to", new_specific),
                   observability::IntField("rows", rows)});
  return Result::Ok();
}

std::vector<std::string> ExtendedStore::KeyColumns(std::string_view kind_table, const KeyValues& key) const {
  auto columns = introspector_->KeyColumnsOf(layout_.Extended(kind_table));
  if (columns.size() != key.size()) {
    throw util::InvalidArgument(std::string(kind_table) + " expects " + std::to_string(columns.size()) +
                                " key parts, got " + std::to_string(key.size()));
  }
  return columns;
}

Result ExtendedStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

} // namespace doccat::store
