#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/catalog/introspector.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/ddl/statement.hpp"

namespace doccat::ddl {

/*
  Everything the generators need about one object kind, read from live
  metadata: the native column list in declared order, the extended key in
  key order, and the columns an extended row copies from the native row.
*/
struct KindTemplate {
  std::string   kind_table;
  QualifiedName native;
  QualifiedName extended;
  QualifiedName merged;

  std::vector<std::string> native_columns;

  // empty when the native table has no comment column
  std::string comment_column;

  std::vector<ColumnSource> keys;
  std::vector<ColumnSource> carried;

  bool HasCommentColumn() const {
    return !comment_column.empty();
  }

  bool HasNativeColumn(std::string_view name) const;
};

/*
  Throws MetadataNotFound when either table is missing (or the extended
  table has no comment column), KeyShapeViolation when the extended table
  has no primary key or a key column the native table lacks.
*/
KindTemplate BuildKindTemplate(const catalog::Introspector& introspector, const catalog::NamespaceLayout& layout,
                               std::string_view kind_table);

} // namespace doccat::ddl
