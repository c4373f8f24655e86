#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/catalog/introspector.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/ddl/statement.hpp"
#include "internal/ddl/trigger_policy.hpp"

namespace doccat::store {

using KeyValues = std::vector<std::string>;

/*
  Long-form comment tables, one per object kind, in the extended namespace.

  Rows are keyed by the kind's key tuple and hold one nullable comment.
  Direct writes go through ApplyComment(), which follows the same
  transition table the merge view triggers are generated from.

  All calls take the caller's transaction.
*/
class ExtendedStore {
 public:
  ExtendedStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<catalog::Introspector> introspector,
                catalog::NamespaceLayout layout);

  std::unique_ptr<db::Transaction> Begin();

  // CREATE TABLE for every registered kind, in registry order
  std::vector<ddl::Statement> PlanCreateTables() const;

  bool HasTable(std::string_view kind_table) const;

  /*
    Sets or clears the comment of one object. applied reports the
    transition taken; an absent or empty comment clears.
  */
  db::Result ApplyComment(db::Transaction& tx, std::string_view kind_table, const KeyValues& key,
                          const std::optional<std::string>& comment, ddl::CommentAction& applied);

  std::optional<std::string> GetComment(db::Transaction& tx, std::string_view kind_table, const KeyValues& key);

  std::size_t CountRows(db::Transaction& tx, std::string_view kind_table);

  /*
    Replace the comments of routine new_specific (or of its parameters)
    with those of old_specific, both in schema. Used to document an
    overload like an existing one.
  */
  db::Result CopyRoutineComments(db::Transaction& tx, const std::string& schema, const std::string& old_specific,
                                 const std::string& new_specific);
  db::Result CopyRoutineParameterComments(db::Transaction& tx, const std::string& schema,
                                          const std::string& old_specific, const std::string& new_specific);

 private:
  static db::Result Translate(sqlite3* db, int rc);

  db::Result CopyByRoutine(db::Transaction& tx, std::string_view kind_table, const std::string& schema,
                           const std::string& old_specific, const std::string& new_specific);

  std::vector<std::string> KeyColumns(std::string_view kind_table, const KeyValues& key) const;

  std::shared_ptr<db::sqlite::SqliteDB>  db_;
  std::shared_ptr<catalog::Introspector> introspector_;
  catalog::NamespaceLayout               layout_;
};

} // namespace doccat::store
