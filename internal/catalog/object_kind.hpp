#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace doccat::catalog {

inline constexpr std::string_view kCommentColumn = "REMARKS";

// longest comment the native catalog accepts, in code points
inline constexpr std::size_t kNativeCommentLimit = 254;

enum class ObjectKind : std::uint8_t {
  kType,
  kColumn,
  kConstraint,
  kIndex,
  kRoutine,
  kRoutineParameter,
  kSchema,
  kTable,
  kTrigger,
  kTablespace,
};

/*
  Column of an extended table. default_sql is the SQL text of the DEFAULT
  clause (e.g. '' for an empty string).
*/
struct ColumnDefinition {
  std::string                name;
  std::string                type = "VARCHAR(128)";
  bool                       not_null = false;
  std::optional<std::string> default_sql;
  std::string                check_sql;
};

/*
  Name synthesized from an ordinal when the native value is missing:
  PARMNAME = 'P' || ORDINAL.
*/
struct SynthesizedName {
  std::string column;
  std::string prefix;
  std::string ordinal_column;
};

/*
  Static description of one catalog object kind.

  key_columns and extended_columns describe the extended table doccat
  creates. Generators never read them: they read the live table metadata
  through the Introspector.
*/
struct KindSpec {
  ObjectKind  kind;
  std::string table;

  // COMMENT ON target keyword; empty when the kind is not exported
  std::string comment_target;

  // target used instead when discriminator_column equals discriminator_value
  std::string discriminator_column;
  std::string discriminator_value;
  std::string discriminated_target;

  std::vector<std::string>       key_columns;
  std::vector<ColumnDefinition>  extended_columns;
  std::optional<SynthesizedName> synthesized_name;

  bool Exported() const {
    return !comment_target.empty();
  }

  // COMMENT ON target for a row whose discriminator column holds value
  std::string TargetFor(const std::optional<std::string>& value) const;
};

// Every kind with an extended table, in import order.
const std::vector<KindSpec>& AllKinds();

// Exported kinds in COMMENT ON emission order.
std::vector<const KindSpec*> ExportOrder();

const KindSpec* FindKind(std::string_view table);
const KindSpec& SpecOf(ObjectKind kind);

} // namespace doccat::catalog
