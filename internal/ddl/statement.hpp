#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/catalog/object_kind.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/ddl/trigger_policy.hpp"

namespace doccat::ddl {

using catalog::QualifiedName;

/*
  Where a copied value comes from when a row is taken over from the native
  catalog. kEmptyIfNull maps NULL to '' for key columns that default to
  ''; kSynthesizedName fills a missing name as prefix || ordinal.
*/
enum class ValueSource { kDirect, kEmptyIfNull, kSynthesizedName };

struct ColumnSource {
  std::string column;
  ValueSource source = ValueSource::kDirect;

  // kSynthesizedName only
  std::string prefix;
  std::string ordinal_column;
};

// expression reading the column from row alias (S, OLD, ...)
std::string RenderSource(const ColumnSource& column, const std::string& row_alias);

struct CreateSchema {
  std::string schema;
};

// always restricted: refused while anything still lives in the namespace
struct DropSchema {
  std::string schema;
};

struct CreateTable {
  QualifiedName                          table;
  std::vector<catalog::ColumnDefinition> columns;
  std::vector<std::string>               primary_key;
};

struct ViewColumn {
  std::string name;
  std::string expression;
};

struct JoinCondition {
  std::string left;
  std::string right;
};

struct LeftJoin {
  QualifiedName              table;
  std::string                alias;
  std::vector<JoinCondition> conditions;
};

struct CreateView {
  QualifiedName           view;
  QualifiedName           source;
  std::string             source_alias;
  std::vector<ViewColumn> columns;
  std::optional<LeftJoin> join;
};

// pass-through of a native table under the merged namespace
struct CreateAlias {
  QualifiedName alias;
  QualifiedName target;
};

struct CreateTrigger {
  QualifiedName             trigger;
  QualifiedName             view;
  QualifiedName             target;
  std::string               comment_column;
  std::vector<ColumnSource> keys;
  std::vector<ColumnSource> carried;
  std::vector<TriggerStep>  steps;
};

struct CreateRoutine {
  QualifiedName            routine;
  char                     routine_type = 'P';
  std::vector<std::string> parameters;
};

enum class ObjectType { kAlias, kTrigger, kView, kRoutine, kTable };

struct DropObject {
  ObjectType    type;
  QualifiedName name;
};

using Statement =
    std::variant<CreateSchema, DropSchema, CreateTable, CreateView, CreateAlias, CreateTrigger, CreateRoutine, DropObject>;

std::string ToSql(const CreateSchema& stmt);
std::string ToSql(const DropSchema& stmt);
std::string ToSql(const CreateTable& stmt);
std::string ToSql(const CreateView& stmt);
std::string ToSql(const CreateAlias& stmt);
std::string ToSql(const CreateTrigger& stmt);
std::string ToSql(const CreateRoutine& stmt);
std::string ToSql(const DropObject& stmt);
std::string ToSql(const Statement& stmt);

// "create view DOCCAT.COLUMNS"
std::string Describe(const Statement& stmt);

/*
  Statements SQLite cannot run itself (schemas and routines exist only in
  the native catalog); ToSql() renders them for plans only.
*/
bool IsCatalogOnly(const Statement& stmt);

} // namespace doccat::ddl
