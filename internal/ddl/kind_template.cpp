#include "internal/ddl/kind_template.hpp"

#include <algorithm>

#include "internal/catalog/object_kind.hpp"
#include "internal/util/errors.hpp"

namespace doccat::ddl {

bool KindTemplate::HasNativeColumn(std::string_view name) const {
  return std::find(native_columns.begin(), native_columns.end(), name) != native_columns.end();
}

KindTemplate BuildKindTemplate(const catalog::Introspector& introspector, const catalog::NamespaceLayout& layout,
                               std::string_view kind_table) {
  KindTemplate tmpl;
  tmpl.kind_table = std::string(kind_table);
  tmpl.native     = layout.Native(kind_table);
  tmpl.extended   = layout.Extended(kind_table);
  tmpl.merged     = layout.Merged(kind_table);

  for (const auto& column : introspector.ColumnsOf(tmpl.native)) {
    tmpl.native_columns.push_back(column.name);
  }
  if (tmpl.HasNativeColumn(catalog::kCommentColumn)) {
    tmpl.comment_column = std::string(catalog::kCommentColumn);
  }

  auto extended = introspector.ColumnsOf(tmpl.extended);

  std::vector<const catalog::ColumnInfo*> keys;
  bool                                    has_comment = false;
  for (const auto& column : extended) {
    if (column.IsKey()) {
      keys.push_back(&column);
    } else if (column.name == catalog::kCommentColumn) {
      has_comment = true;
    }
  }
  if (!has_comment) {
    throw util::MetadataNotFound(tmpl.extended.Physical() + " has no " + std::string(catalog::kCommentColumn) +
                                 " column");
  }
  if (keys.empty()) {
    throw util::KeyShapeViolation(tmpl.extended.Physical() + " has no primary key");
  }
  std::sort(keys.begin(), keys.end(), [](const catalog::ColumnInfo* a, const catalog::ColumnInfo* b) {
    return a->key_position < b->key_position;
  });

  for (const auto* key : keys) {
    if (!tmpl.HasNativeColumn(key->name)) {
      throw util::KeyShapeViolation("key column " + key->name + " of " + tmpl.extended.Physical() +
                                    " is missing from " + tmpl.native.Physical());
    }
    ColumnSource source;
    source.column = key->name;
    source.source = key->DefaultsToEmptyString() ? ValueSource::kEmptyIfNull : ValueSource::kDirect;
    tmpl.keys.push_back(std::move(source));
  }

  const catalog::KindSpec* spec = catalog::FindKind(kind_table);
  for (const auto& column : extended) {
    if (column.IsKey() || column.name == catalog::kCommentColumn) continue;
    if (!tmpl.HasNativeColumn(column.name)) {
      throw util::MetadataNotFound("column " + column.name + " of " + tmpl.extended.Physical() +
                                   " is missing from " + tmpl.native.Physical());
    }

    ColumnSource source;
    source.column = column.name;
    if (spec && spec->synthesized_name && spec->synthesized_name->column == column.name) {
      source.source         = ValueSource::kSynthesizedName;
      source.prefix         = spec->synthesized_name->prefix;
      source.ordinal_column = spec->synthesized_name->ordinal_column;
    }
    tmpl.carried.push_back(std::move(source));
  }

  return tmpl;
}

} // namespace doccat::ddl
