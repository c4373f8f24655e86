#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/catalog/qualified_name.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace doccat::catalog {

struct ColumnInfo {
  std::string                name;
  int                        position = 0;
  std::string                declared_type;
  bool                       not_null = false;
  std::optional<std::string> default_value;

  // 1-based position within the primary key, 0 when not a key column
  int key_position = 0;

  bool IsKey() const {
    return key_position > 0;
  }

  bool DefaultsToEmptyString() const {
    return default_value && *default_value == "''";
  }
};

enum class SchemaObjectType { kTable, kView, kTrigger, kIndex };

struct SchemaObject {
  SchemaObjectType type;
  QualifiedName    name;

  std::string Describe() const;
};

/*
  Reads live table metadata from the SQLite schema.

  Everything that generates SQL derives column lists and key shapes from
  here, never from a hard-coded list.
*/
class Introspector {
 public:
  explicit Introspector(std::shared_ptr<db::sqlite::SqliteDB> db);

  bool TableExists(const QualifiedName& table) const;
  bool ObjectExists(const QualifiedName& object) const;

  // table, view, trigger or index; nullopt when the object does not exist
  std::optional<SchemaObjectType> TypeOf(const QualifiedName& object) const;

  // declared column order; throws MetadataNotFound for a missing table
  std::vector<ColumnInfo> ColumnsOf(const QualifiedName& table) const;

  // primary key columns in key order
  std::vector<std::string> KeyColumnsOf(const QualifiedName& table) const;

  // base tables of a namespace, sorted by name
  std::vector<std::string> TablesIn(std::string_view ns) const;

  std::vector<SchemaObject> ObjectsIn(std::string_view ns) const;

  // views and triggers whose definition references the object
  std::vector<SchemaObject> DependentsOf(const QualifiedName& object) const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace doccat::catalog
