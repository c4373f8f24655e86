#include "internal/sync/importer.hpp"

#include <exception>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace doccat::sync {

using catalog::QuoteIdentifier;

CommentImporter::CommentImporter(std::shared_ptr<db::sqlite::SqliteDB> db,
                                 std::shared_ptr<catalog::Introspector> introspector, catalog::NamespaceLayout layout)
    : db_(std::move(db)), introspector_(std::move(introspector)), layout_(std::move(layout)) {
}

std::string CommentImporter::CopySql(const ddl::KindTemplate& tmpl) {
  if (!tmpl.HasCommentColumn()) {
    throw util::MetadataNotFound(tmpl.native.Physical() + " has no comment column to import");
  }

  std::string columns;
  std::string values;
  auto        append = [&](const ddl::ColumnSource& source) {
    columns += QuoteIdentifier(source.column) + ", ";
    values += ddl::RenderSource(source, "S") + ", ";
  };
  for (const auto& key : tmpl.keys) append(key);
  for (const auto& carried : tmpl.carried) append(carried);

  std::string comment = QuoteIdentifier(tmpl.comment_column);
  columns += comment;
  values += "S." + comment;

  return "INSERT INTO " + tmpl.extended.Quoted() + " (" + columns + ") SELECT " + values + " FROM " +
         tmpl.native.Quoted() + " S WHERE COALESCE(S." + comment + ", '') <> ''";
}

ImportReport CommentImporter::ImportFromNative() const {
  observability::SpanScope span("CommentImporter.ImportFromNative");

  ImportReport             report;
  std::vector<std::string> committed;

  for (const auto& table : introspector_->TablesIn(layout_.extended)) {
    if (!introspector_->TableExists(layout_.Native(table))) {
      DOCCAT_LOG_DEBUG("extended table has no native counterpart", {observability::StringField("kind", table)});
      continue;
    }

    try {
      std::size_t rows = ImportKind(table);
      report.kinds.push_back({table, rows});
      committed.push_back(table);
      observability::Metrics::Instance().AddImportedRows(table, rows);
      DOCCAT_LOG_INFO("kind imported", {observability::StringField("kind", table),
                                        observability::IntField("rows", static_cast<std::int64_t>(rows))});
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      DOCCAT_LOG_ERROR("import failed", {observability::StringField("kind", table),
                                         observability::StringField("error", e.what())});
      throw util::ImportAborted(table, committed, e.what());
    }
  }

  span.SetAttribute("rows", static_cast<std::int64_t>(report.TotalRows()));
  return report;
}

std::size_t CommentImporter::ImportKind(const std::string& kind_table) const {
  auto tmpl = ddl::BuildKindTemplate(*introspector_, layout_, kind_table);
  auto sql  = CopySql(tmpl);

  db::sqlite::SqliteTransaction tx(db_);
  db_->Exec("DELETE FROM " + tmpl.extended.Quoted());
  db_->Exec(sql);
  auto rows = static_cast<std::size_t>(sqlite3_changes(db_->Handle()));
  tx.Commit();
  return rows;
}

} // namespace doccat::sync
