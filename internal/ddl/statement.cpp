#include "internal/ddl/statement.hpp"

#include "internal/util/errors.hpp"

namespace doccat::ddl {

using catalog::QuoteIdentifier;
using catalog::QuoteLiteral;

namespace {

std::string Column(const std::string& row_alias, const std::string& column) {
  return row_alias + "." + QuoteIdentifier(column);
}

std::string KeyMatch(const std::vector<ColumnSource>& keys) {
  std::string predicate;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i > 0) predicate += " AND ";
    predicate += QuoteIdentifier(keys[i].column) + " = " + RenderSource(keys[i], "OLD");
  }
  return predicate;
}

std::string NullGuard(const std::string& comment_column, bool new_is_null) {
  return "NULLIF(" + Column("NEW", comment_column) + ", '') IS " + (new_is_null ? "NULL" : "NOT NULL");
}

std::string RenderStep(const CreateTrigger& trigger, const TriggerStep& step) {
  bool expects_row = step.action == CommentAction::kUpdate || step.action == CommentAction::kDelete;
  if (step.action != CommentAction::kNoop && expects_row != step.row_exists) {
    throw util::InvalidArgument("trigger step does not match its row guard on " + trigger.trigger.Physical());
  }

  std::string target = trigger.target.Quoted();
  std::string guard  = NullGuard(trigger.comment_column, step.new_is_null);

  switch (step.action) {
    case CommentAction::kNoop:
      return {};
    case CommentAction::kDelete:
      return "DELETE FROM " + target + " WHERE " + KeyMatch(trigger.keys) + " AND " + guard + "; ";
    case CommentAction::kUpdate:
      return "UPDATE " + target + " SET " + QuoteIdentifier(trigger.comment_column) + " = " +
             Column("NEW", trigger.comment_column) + " WHERE " + KeyMatch(trigger.keys) + " AND " + guard + "; ";
    case CommentAction::kInsert: {
      std::string columns;
      std::string values;
      auto        append = [&](const ColumnSource& source) {
        columns += QuoteIdentifier(source.column) + ", ";
        values += RenderSource(source, "OLD") + ", ";
      };
      for (const auto& key : trigger.keys) append(key);
      for (const auto& carried : trigger.carried) append(carried);
      columns += QuoteIdentifier(trigger.comment_column);
      values += Column("NEW", trigger.comment_column);

      return "INSERT INTO " + target + " (" + columns + ") SELECT " + values + " WHERE " + guard +
             " AND NOT EXISTS (SELECT 1 FROM " + target + " WHERE " + KeyMatch(trigger.keys) + "); ";
    }
  }
  return {};
}

std::string_view ObjectTypeName(ObjectType type) {
  switch (type) {
    case ObjectType::kAlias:
      return "alias";
    case ObjectType::kTrigger:
      return "trigger";
    case ObjectType::kView:
      return "view";
    case ObjectType::kRoutine:
      return "procedure";
    case ObjectType::kTable:
      return "table";
  }
  return "object";
}

} // namespace

std::string RenderSource(const ColumnSource& column, const std::string& row_alias) {
  switch (column.source) {
    case ValueSource::kDirect:
      return Column(row_alias, column.column);
    case ValueSource::kEmptyIfNull:
      return "COALESCE(" + Column(row_alias, column.column) + ", '')";
    case ValueSource::kSynthesizedName: {
      std::string value = Column(row_alias, column.column);
      return "CASE WHEN " + value + " IS NULL OR " + value + " = '' THEN " + QuoteLiteral(column.prefix) +
             " || " + Column(row_alias, column.ordinal_column) + " ELSE " + value + " END";
    }
  }
  return Column(row_alias, column.column);
}

std::string ToSql(const CreateSchema& stmt) {
  return "CREATE SCHEMA " + QuoteIdentifier(stmt.schema);
}

std::string ToSql(const DropSchema& stmt) {
  return "DROP SCHEMA " + QuoteIdentifier(stmt.schema) + " RESTRICT";
}

std::string ToSql(const CreateTable& stmt) {
  std::string sql = "CREATE TABLE " + stmt.table.Quoted() + " (";
  for (const auto& column : stmt.columns) {
    sql += QuoteIdentifier(column.name) + " " + column.type;
    if (column.not_null) sql += " NOT NULL";
    if (column.default_sql) sql += " DEFAULT " + *column.default_sql;
    if (!column.check_sql.empty()) sql += " CHECK (" + column.check_sql + ")";
    sql += ", ";
  }
  sql += "PRIMARY KEY (";
  for (std::size_t i = 0; i < stmt.primary_key.size(); ++i) {
    if (i > 0) sql += ", ";
    sql += QuoteIdentifier(stmt.primary_key[i]);
  }
  sql += "))";
  return sql;
}

std::string ToSql(const CreateView& stmt) {
  std::string names;
  std::string select;
  for (std::size_t i = 0; i < stmt.columns.size(); ++i) {
    if (i > 0) {
      names += ", ";
      select += ", ";
    }
    names += QuoteIdentifier(stmt.columns[i].name);
    select += stmt.columns[i].expression;
  }

  std::string sql = "CREATE VIEW " + stmt.view.Quoted() + " (" + names + ") AS SELECT " + select + " FROM " +
                    stmt.source.Quoted() + " " + stmt.source_alias;
  if (stmt.join) {
    sql += " LEFT JOIN " + stmt.join->table.Quoted() + " " + stmt.join->alias + " ON ";
    for (std::size_t i = 0; i < stmt.join->conditions.size(); ++i) {
      if (i > 0) sql += " AND ";
      sql += stmt.join->conditions[i].left + " = " + stmt.join->conditions[i].right;
    }
  }
  return sql;
}

std::string ToSql(const CreateAlias& stmt) {
  return "CREATE VIEW " + stmt.alias.Quoted() + " AS SELECT * FROM " + stmt.target.Quoted();
}

std::string ToSql(const CreateTrigger& stmt) {
  std::string sql = "CREATE TRIGGER " + stmt.trigger.Quoted() + " INSTEAD OF UPDATE OF " +
                    QuoteIdentifier(stmt.comment_column) + " ON " + stmt.view.Quoted() + " FOR EACH ROW BEGIN ";
  for (const auto& step : stmt.steps) {
    sql += RenderStep(stmt, step);
  }
  sql += "END";
  return sql;
}

std::string ToSql(const CreateRoutine& stmt) {
  std::string sql = std::string(stmt.routine_type == 'P' ? "CREATE PROCEDURE " : "CREATE FUNCTION ") +
                    stmt.routine.Quoted() + " (";
  for (std::size_t i = 0; i < stmt.parameters.size(); ++i) {
    if (i > 0) sql += ", ";
    sql += QuoteIdentifier(stmt.parameters[i]) + " VARCHAR(128)";
  }
  sql += ") SPECIFIC " + QuoteIdentifier(stmt.routine.name) + " LANGUAGE CPP";
  return sql;
}

std::string ToSql(const DropObject& stmt) {
  switch (stmt.type) {
    case ObjectType::kAlias:
    case ObjectType::kView:
      return "DROP VIEW " + stmt.name.Quoted();
    case ObjectType::kTrigger:
      return "DROP TRIGGER " + stmt.name.Quoted();
    case ObjectType::kRoutine:
      return "DROP SPECIFIC PROCEDURE " + stmt.name.Quoted();
    case ObjectType::kTable:
      return "DROP TABLE " + stmt.name.Quoted();
  }
  return {};
}

std::string ToSql(const Statement& stmt) {
  return std::visit([](const auto& s) { return ToSql(s); }, stmt);
}

std::string Describe(const Statement& stmt) {
  if (const auto* s = std::get_if<CreateSchema>(&stmt)) return "create schema " + s->schema;
  if (const auto* s = std::get_if<DropSchema>(&stmt)) return "drop schema " + s->schema;
  if (const auto* s = std::get_if<CreateTable>(&stmt)) return "create table " + s->table.Physical();
  if (const auto* s = std::get_if<CreateView>(&stmt)) return "create view " + s->view.Physical();
  if (const auto* s = std::get_if<CreateAlias>(&stmt)) return "create alias " + s->alias.Physical();
  if (const auto* s = std::get_if<CreateTrigger>(&stmt)) return "create trigger " + s->trigger.Physical();
  if (const auto* s = std::get_if<CreateRoutine>(&stmt)) return "create procedure " + s->routine.Physical();

  const auto& drop = std::get<DropObject>(stmt);
  return "drop " + std::string(ObjectTypeName(drop.type)) + " " + drop.name.Physical();
}

bool IsCatalogOnly(const Statement& stmt) {
  return std::holds_alternative<CreateSchema>(stmt) || std::holds_alternative<DropSchema>(stmt) ||
         std::holds_alternative<CreateRoutine>(stmt) ||
         (std::holds_alternative<DropObject>(stmt) && std::get<DropObject>(stmt).type == ObjectType::kRoutine);
}

} // namespace doccat::ddl
