#include "internal/catalog/introspector.hpp"

#include <algorithm>

#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/util/errors.hpp"

namespace doccat::catalog {

using db::sqlite::SqliteStatement;

namespace {

std::optional<SchemaObjectType> ParseType(std::string_view type) {
  if (type == "table") return SchemaObjectType::kTable;
  if (type == "view") return SchemaObjectType::kView;
  if (type == "trigger") return SchemaObjectType::kTrigger;
  if (type == "index") return SchemaObjectType::kIndex;
  return std::nullopt;
}

std::string_view TypeName(SchemaObjectType type) {
  switch (type) {
    case SchemaObjectType::kTable:
      return "table";
    case SchemaObjectType::kView:
      return "view";
    case SchemaObjectType::kTrigger:
      return "trigger";
    case SchemaObjectType::kIndex:
      return "index";
  }
  return "object";
}

std::vector<SchemaObject> ReadObjects(SqliteStatement& stmt) {
  std::vector<SchemaObject> objects;
  while (stmt.Step()) {
    auto type = ParseType(stmt.ColumnText(0));
    if (!type) continue;
    objects.push_back({*type, FromPhysical(stmt.ColumnText(1))});
  }
  return objects;
}

} // namespace

std::string SchemaObject::Describe() const {
  return std::string(TypeName(type)) + " " + name.Physical();
}

Introspector::Introspector(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

bool Introspector::TableExists(const QualifiedName& table) const {
  auto type = TypeOf(table);
  return type == SchemaObjectType::kTable || type == SchemaObjectType::kView;
}

bool Introspector::ObjectExists(const QualifiedName& object) const {
  return TypeOf(object).has_value();
}

std::optional<SchemaObjectType> Introspector::TypeOf(const QualifiedName& object) const {
  SqliteStatement stmt(db_->Handle(), "SELECT type FROM sqlite_master WHERE name = ?");
  stmt.BindText(1, object.Physical());
  if (!stmt.Step()) return std::nullopt;
  return ParseType(stmt.ColumnText(0));
}

std::vector<ColumnInfo> Introspector::ColumnsOf(const QualifiedName& table) const {
  if (!TableExists(table)) {
    throw util::MetadataNotFound("table " + table.Physical() + " does not exist");
  }

  SqliteStatement stmt(db_->Handle(),
                       "SELECT cid, name, type, \"notnull\", dflt_value, pk "
                       "FROM pragma_table_info(?) ORDER BY cid");
  stmt.BindText(1, table.Physical());

  std::vector<ColumnInfo> columns;
  while (stmt.Step()) {
    ColumnInfo column;
    column.position      = static_cast<int>(stmt.ColumnInt64(0));
    column.name          = stmt.ColumnText(1);
    column.declared_type = stmt.ColumnText(2);
    column.not_null      = stmt.ColumnInt64(3) != 0;
    column.default_value = stmt.ColumnOptionalText(4);
    column.key_position  = static_cast<int>(stmt.ColumnInt64(5));
    columns.push_back(std::move(column));
  }

  if (columns.empty()) {
    throw util::MetadataNotFound("no column metadata for " + table.Physical());
  }
  return columns;
}

std::vector<std::string> Introspector::KeyColumnsOf(const QualifiedName& table) const {
  auto columns = ColumnsOf(table);

  std::vector<const ColumnInfo*> keys;
  for (const auto& column : columns) {
    if (column.IsKey()) keys.push_back(&column);
  }
  std::sort(keys.begin(), keys.end(),
            [](const ColumnInfo* a, const ColumnInfo* b) { return a->key_position < b->key_position; });

  std::vector<std::string> names;
  names.reserve(keys.size());
  for (const auto* key : keys) {
    names.push_back(key->name);
  }
  return names;
}

std::vector<std::string> Introspector::TablesIn(std::string_view ns) const {
  std::string prefix = std::string(ns) + ".";

  SqliteStatement stmt(db_->Handle(),
                       "SELECT name FROM sqlite_master WHERE type = 'table' "
                       "AND substr(name, 1, length(?1)) = ?1 ORDER BY name");
  stmt.BindText(1, prefix);

  std::vector<std::string> tables;
  while (stmt.Step()) {
    tables.push_back(FromPhysical(stmt.ColumnText(0)).name);
  }
  return tables;
}

std::vector<SchemaObject> Introspector::ObjectsIn(std::string_view ns) const {
  std::string prefix = std::string(ns) + ".";

  SqliteStatement stmt(db_->Handle(),
                       "SELECT type, name FROM sqlite_master "
                       "WHERE substr(name, 1, length(?1)) = ?1 ORDER BY name");
  stmt.BindText(1, prefix);
  return ReadObjects(stmt);
}

std::vector<SchemaObject> Introspector::DependentsOf(const QualifiedName& object) const {
  SqliteStatement stmt(db_->Handle(),
                       "SELECT type, name FROM sqlite_master "
                       "WHERE type IN ('view', 'trigger') AND name <> ?1 AND instr(sql, ?2) > 0 "
                       "ORDER BY name");
  stmt.BindText(1, object.Physical());
  stmt.BindText(2, object.Quoted());
  return ReadObjects(stmt);
}

} // namespace doccat::catalog
