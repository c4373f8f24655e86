#include "internal/catalog/object_kind.hpp"

#include <stdexcept>

namespace doccat::catalog {

namespace {

ColumnDefinition Key(std::string name) {
  ColumnDefinition column;
  column.name     = std::move(name);
  column.not_null = true;
  return column;
}

// key column that may be NULL in the native catalog; stored as ''
ColumnDefinition EmptyDefaultKey(std::string name) {
  ColumnDefinition column = Key(std::move(name));
  column.default_sql      = "''";
  return column;
}

ColumnDefinition Remarks() {
  ColumnDefinition column;
  column.name = std::string(kCommentColumn);
  column.type = "CLOB(1048576)";
  return column;
}

KindSpec Make(ObjectKind kind, std::string table, std::string target, std::vector<ColumnDefinition> keys) {
  KindSpec spec;
  spec.kind           = kind;
  spec.table          = std::move(table);
  spec.comment_target = std::move(target);
  for (const auto& key : keys) {
    spec.key_columns.push_back(key.name);
  }
  spec.extended_columns = std::move(keys);
  spec.extended_columns.push_back(Remarks());
  return spec;
}

std::vector<KindSpec> BuildRegistry() {
  std::vector<KindSpec> kinds;

  kinds.push_back(Make(ObjectKind::kType, "DATATYPES", "TYPE", {Key("TYPESCHEMA"), Key("TYPENAME")}));

  kinds.push_back(
      Make(ObjectKind::kColumn, "COLUMNS", "COLUMN", {Key("TABSCHEMA"), Key("TABNAME"), Key("COLNAME")}));

  kinds.push_back(Make(ObjectKind::kConstraint, "TABCONST", "CONSTRAINT",
                       {Key("TABSCHEMA"), Key("TABNAME"), Key("CONSTNAME")}));

  kinds.push_back(Make(ObjectKind::kIndex, "INDEXES", "INDEX", {Key("INDSCHEMA"), Key("INDNAME")}));

  {
    KindSpec routines = Make(ObjectKind::kRoutine, "ROUTINES", "SPECIFIC FUNCTION",
                             {Key("ROUTINESCHEMA"), Key("SPECIFICNAME")});
    routines.discriminator_column = "ROUTINETYPE";
    routines.discriminator_value  = "P";
    routines.discriminated_target = "SPECIFIC PROCEDURE";
    kinds.push_back(std::move(routines));
  }

  {
    ColumnDefinition rowtype = Key("ROWTYPE");
    rowtype.type             = "CHAR(1)";
    rowtype.check_sql        = "\"ROWTYPE\" IN ('B','C','O','P','R')";

    ColumnDefinition ordinal = Key("ORDINAL");
    ordinal.type             = "SMALLINT";
    ordinal.check_sql        = "\"ORDINAL\" >= 0";

    KindSpec parms = Make(ObjectKind::kRoutineParameter, "ROUTINEPARMS", "",
                          {EmptyDefaultKey("ROUTINESCHEMA"), EmptyDefaultKey("SPECIFICNAME"), rowtype, ordinal});

    // PARMNAME rides along as a plain column, ahead of REMARKS
    ColumnDefinition parmname;
    parmname.name = "PARMNAME";
    parms.extended_columns.insert(parms.extended_columns.end() - 1, parmname);
    parms.synthesized_name = SynthesizedName{"PARMNAME", "P", "ORDINAL"};
    kinds.push_back(std::move(parms));
  }

  kinds.push_back(Make(ObjectKind::kSchema, "SCHEMATA", "SCHEMA", {Key("SCHEMANAME")}));
  kinds.push_back(Make(ObjectKind::kTable, "TABLES", "TABLE", {Key("TABSCHEMA"), Key("TABNAME")}));
  kinds.push_back(Make(ObjectKind::kTrigger, "TRIGGERS", "TRIGGER", {Key("TRIGSCHEMA"), Key("TRIGNAME")}));
  kinds.push_back(Make(ObjectKind::kTablespace, "TABLESPACES", "TABLESPACE", {Key("TBSPACE")}));

  return kinds;
}

} // namespace

std::string KindSpec::TargetFor(const std::optional<std::string>& value) const {
  if (!discriminator_column.empty() && value && *value == discriminator_value) {
    return discriminated_target;
  }
  return comment_target;
}

const std::vector<KindSpec>& AllKinds() {
  static const std::vector<KindSpec> kinds = BuildRegistry();
  return kinds;
}

std::vector<const KindSpec*> ExportOrder() {
  // containers before their members
  static constexpr ObjectKind kOrder[] = {
      ObjectKind::kTablespace, ObjectKind::kSchema,  ObjectKind::kTable,
      ObjectKind::kColumn,     ObjectKind::kConstraint, ObjectKind::kIndex,
      ObjectKind::kTrigger,    ObjectKind::kRoutine, ObjectKind::kType,
  };

  std::vector<const KindSpec*> order;
  for (ObjectKind kind : kOrder) {
    order.push_back(&SpecOf(kind));
  }
  return order;
}

const KindSpec* FindKind(std::string_view table) {
  for (const auto& spec : AllKinds()) {
    if (spec.table == table) return &spec;
  }
  return nullptr;
}

const KindSpec& SpecOf(ObjectKind kind) {
  for (const auto& spec : AllKinds()) {
    if (spec.kind == kind) return spec;
  }
  throw std::logic_error("unregistered object kind");
}

} // namespace doccat::catalog
