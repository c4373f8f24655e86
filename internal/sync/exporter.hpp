#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/introspector.hpp"
#include "internal/catalog/native_catalog.hpp"
#include "internal/catalog/object_kind.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/sync/comment_statement.hpp"

namespace doccat::sync {

/*
  Lazy walk over the exportable extended comments, one kind after another.
  Reads happen on Next(); the cursor keeps one prepared statement open.
*/
class ExportCursor {
 public:
  struct Source {
    const catalog::KindSpec* kind = nullptr;
    std::string              sql;
    std::size_t              key_count = 0;
  };

  ExportCursor(std::shared_ptr<db::sqlite::SqliteDB> db, std::vector<Source> sources);

  // nullopt once every kind is exhausted
  std::optional<CommentStatement> Next();

  std::size_t Emitted() const {
    return emitted_;
  }

  std::size_t Truncated() const {
    return truncated_;
  }

 private:
  bool OpenNextSource();

  std::shared_ptr<db::sqlite::SqliteDB>      db_;
  std::vector<Source>                        sources_;
  std::size_t                                next_source_ = 0;
  std::optional<db::sqlite::SqliteStatement> current_;

  std::size_t emitted_   = 0;
  std::size_t truncated_ = 0;
};

struct ApplyReport {
  std::size_t applied   = 0;
  std::size_t truncated = 0;

  // statements whose object no longer matches a native row
  std::size_t unmatched = 0;
};

/*
  Renders extended comments as native COMMENT ON statements.

  Only kinds with a native statement target and both tables present are
  exported; rows are taken when their object exists natively and their
  comment is non-empty, in kind order then key order.
*/
class CommentExporter {
 public:
  CommentExporter(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<catalog::Introspector> introspector,
                  catalog::NamespaceLayout layout);

  // fresh cursor on every call; metadata is re-read here
  ExportCursor Export() const;

  std::vector<CommentStatement> ExportAll() const;

  // executes every exported statement against the native catalog in one unit of work
  ApplyReport ApplyToNative(catalog::NativeCatalog& native) const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB>  db_;
  std::shared_ptr<catalog::Introspector> introspector_;
  catalog::NamespaceLayout               layout_;
};

} // namespace doccat::sync
