#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/catalog/introspector.hpp"
#include "internal/catalog/object_kind.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace doccat::catalog {

// SYSCAT.TABLES.TYPE
enum class TableType : char {
  kTable = 'T',
  kView  = 'V',
  kAlias = 'A',
};

struct RoutineEntry {
  QualifiedName            specific;
  std::string              routine_name;
  char                     routine_type = 'P';
  std::string              language     = "CPP";
  std::vector<std::string> parameters;
};

/*
  Emulated native catalog.

  SQLite keeps no descriptive catalog, so doccat maintains one: a table per
  object kind in the native namespace, each with a REMARKS column capped at
  kNativeCommentLimit. The DDL executor records every object it creates here,
  the way a database engine maintains its own catalog.
*/
class NativeCatalog {
 public:
  NativeCatalog(std::shared_ptr<db::sqlite::SqliteDB> db, std::string ns);

  const std::string& Namespace() const {
    return ns_;
  }

  QualifiedName Table(std::string_view kind_table) const {
    return {ns_, std::string(kind_table)};
  }

  // creates missing catalog tables and registers them; safe to rerun
  void Bootstrap();

  bool SchemaExists(std::string_view schema) const;
  void RegisterSchema(std::string_view schema);
  void UnregisterSchema(std::string_view schema);

  void RegisterTable(const QualifiedName& table, TableType type, const std::vector<ColumnInfo>& columns);
  void UnregisterTable(const QualifiedName& table);
  std::vector<std::string> TablesOfType(std::string_view schema, TableType type) const;

  void RegisterTrigger(const QualifiedName& trigger, const QualifiedName& subject);
  void UnregisterTrigger(const QualifiedName& trigger);
  std::vector<std::string> TriggersIn(std::string_view schema) const;

  void RegisterRoutine(const RoutineEntry& routine);
  void UnregisterRoutine(const QualifiedName& specific);
  bool RoutineExists(const QualifiedName& specific) const;
  std::vector<std::string> RoutinesIn(std::string_view schema) const;

  /*
    COMMENT ON. An empty or absent text clears the comment; text longer
    than kNativeCommentLimit code points is rejected. Returns the number of
    catalog rows the target matched.
  */
  std::size_t SetRemarks(const KindSpec& kind, const std::string& target, const std::vector<std::string>& key,
                         const std::optional<std::string>& text);

  std::optional<std::string> RemarksOf(const KindSpec& kind, const std::vector<std::string>& key) const;

 private:
  void Exec(const std::string& sql, std::initializer_list<std::string_view> params);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::string                           ns_;
};

} // namespace doccat::catalog
