#include "internal/ddl/view_generator.hpp"

namespace doccat::ddl {

using catalog::QuoteIdentifier;

namespace {

constexpr const char* kNativeAlias   = "S";
constexpr const char* kExtendedAlias = "D";

std::string Column(const char* alias, const std::string& column) {
  return std::string(alias) + "." + QuoteIdentifier(column);
}

} // namespace

CreateView GenerateMergeView(const KindTemplate& tmpl) {
  CreateView view;
  view.view         = tmpl.merged;
  view.source       = tmpl.native;
  view.source_alias = kNativeAlias;

  for (const auto& column : tmpl.native_columns) {
    std::string expression = Column(kNativeAlias, column);
    if (column == tmpl.comment_column) {
      expression = "COALESCE(" + Column(kExtendedAlias, column) + ", " + expression + ")";
    }
    view.columns.push_back({column, expression});
  }

  if (!tmpl.HasCommentColumn()) return view;

  LeftJoin join;
  join.table = tmpl.extended;
  join.alias = kExtendedAlias;
  for (const auto& key : tmpl.keys) {
    join.conditions.push_back({RenderSource(key, kNativeAlias), Column(kExtendedAlias, key.column)});
  }
  view.join = std::move(join);
  return view;
}

} // namespace doccat::ddl
