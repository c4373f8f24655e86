#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/introspector.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/ddl/kind_template.hpp"

namespace doccat::sync {

struct KindImport {
  std::string kind_table;
  std::size_t rows = 0;
};

struct ImportReport {
  std::vector<KindImport> kinds;

  std::size_t TotalRows() const {
    std::size_t total = 0;
    for (const auto& kind : kinds) total += kind.rows;
    return total;
  }
};

/*
  Replaces the extended store with the native comments.

  Each extended table with a native counterpart is emptied and refilled
  in its own transaction. Anything only the extended store held (longer
  text, comments on objects the native catalog does not know) is lost.
*/
class CommentImporter {
 public:
  CommentImporter(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<catalog::Introspector> introspector,
                  catalog::NamespaceLayout layout);

  // throws util::ImportAborted naming the failed kind and the committed ones
  ImportReport ImportFromNative() const;

  // INSERT ... SELECT copying one kind from the native catalog
  static std::string CopySql(const ddl::KindTemplate& tmpl);

 private:
  std::size_t ImportKind(const std::string& kind_table) const;

  std::shared_ptr<db::sqlite::SqliteDB>  db_;
  std::shared_ptr<catalog::Introspector> introspector_;
  catalog::NamespaceLayout               layout_;
};

} // namespace doccat::sync
