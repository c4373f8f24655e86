#include "internal/sync/exporter.hpp"

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/ddl/kind_template.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace doccat::sync {

using catalog::QuoteIdentifier;

namespace {

std::string ExportSql(const ddl::KindTemplate& tmpl, const catalog::KindSpec& kind) {
  std::string comment = QuoteIdentifier(catalog::kCommentColumn);

  std::string select;
  std::string order;
  std::string join;
  for (std::size_t i = 0; i < tmpl.keys.size(); ++i) {
    std::string extended = "D." + QuoteIdentifier(tmpl.keys[i].column);
    if (i > 0) {
      order += ", ";
      join += " AND ";
    }
    select += extended + ", ";
    order += extended;
    join += ddl::RenderSource(tmpl.keys[i], "S") + " = " + extended;
  }
  select += "D." + comment;

  bool discriminated = !kind.discriminator_column.empty() && tmpl.HasNativeColumn(kind.discriminator_column);
  select += discriminated ? ", S." + QuoteIdentifier(kind.discriminator_column) : ", NULL";

  return "SELECT " + select + " FROM " + tmpl.native.Quoted() + " S INNER JOIN " + tmpl.extended.Quoted() +
         " D ON " + join + " WHERE D." + comment + " IS NOT NULL AND D." + comment + " <> '' ORDER BY " + order;
}

} // namespace

ExportCursor::ExportCursor(std::shared_ptr<db::sqlite::SqliteDB> db, std::vector<Source> sources)
    : db_(std::move(db)), sources_(std::move(sources)) {
}

std::optional<CommentStatement> ExportCursor::Next() {
  while (true) {
    if (!current_ && !OpenNextSource()) {
      return std::nullopt;
    }

    if (!current_->Step()) {
      current_.reset();
      continue;
    }

    const Source& source = sources_[next_source_ - 1];

    CommentStatement stmt;
    stmt.kind_table = source.kind->table;
    for (std::size_t i = 0; i < source.key_count; ++i) {
      stmt.key.push_back(current_->ColumnText(static_cast<int>(i)));
    }
    auto encoded = EncodeComment(current_->ColumnText(static_cast<int>(source.key_count)));
    stmt.text      = std::move(encoded.text);
    stmt.truncated = encoded.truncated;
    stmt.target    = source.kind->TargetFor(current_->ColumnOptionalText(static_cast<int>(source.key_count) + 1));

    ++emitted_;
    if (stmt.truncated) {
      ++truncated_;
      DOCCAT_LOG_WARN("comment truncated for the native catalog",
                      {observability::StringField("kind", stmt.kind_table),
                       observability::StringField("object", stmt.Identifier())});
      observability::Metrics::Instance().AddTruncatedComments(stmt.kind_table, 1);
    }
    return stmt;
  }
}

bool ExportCursor::OpenNextSource() {
  if (next_source_ >= sources_.size()) {
    return false;
  }
  current_.emplace(db_->Handle(), sources_[next_source_].sql);
  ++next_source_;
  return true;
}

CommentExporter::CommentExporter(std::shared_ptr<db::sqlite::SqliteDB> db,
                                 std::shared_ptr<catalog::Introspector> introspector, catalog::NamespaceLayout layout)
    : db_(std::move(db)), introspector_(std::move(introspector)), layout_(std::move(layout)) {
}

ExportCursor CommentExporter::Export() const {
  std::vector<ExportCursor::Source> sources;

  for (const auto* kind : catalog::ExportOrder()) {
    if (!introspector_->TableExists(layout_.Native(kind->table)) ||
        !introspector_->TableExists(layout_.Extended(kind->table))) {
      DOCCAT_LOG_DEBUG("kind skipped for export", {observability::StringField("kind", kind->table)});
      continue;
    }

    auto tmpl = ddl::BuildKindTemplate(*introspector_, layout_, kind->table);

    ExportCursor::Source source;
    source.kind      = kind;
    source.sql       = ExportSql(tmpl, *kind);
    source.key_count = tmpl.keys.size();
    sources.push_back(std::move(source));
  }

  return ExportCursor(db_, std::move(sources));
}

std::vector<CommentStatement> CommentExporter::ExportAll() const {
  observability::SpanScope span("CommentExporter.ExportAll");

  std::vector<CommentStatement> statements;
  auto                          cursor = Export();
  while (auto stmt = cursor.Next()) {
    statements.push_back(std::move(*stmt));
  }

  span.SetAttribute("statements", static_cast<std::int64_t>(cursor.Emitted()));
  span.SetAttribute("truncated", static_cast<std::int64_t>(cursor.Truncated()));
  DOCCAT_LOG_INFO("comments exported", {observability::IntField("statements", static_cast<std::int64_t>(cursor.Emitted())),
                                        observability::IntField("truncated", static_cast<std::int64_t>(cursor.Truncated()))});
  return statements;
}

ApplyReport CommentExporter::ApplyToNative(catalog::NativeCatalog& native) const {
  observability::SpanScope span("CommentExporter.ApplyToNative");

  // collect first: the native rows are written while the export reads them
  auto statements = ExportAll();

  ApplyReport                   report;
  db::sqlite::SqliteTransaction tx(db_);

  for (const auto& stmt : statements) {
    const auto* kind = catalog::FindKind(stmt.kind_table);
    if (!kind) {
      throw util::InvalidArgument("unknown object kind " + stmt.kind_table);
    }

    if (native.SetRemarks(*kind, stmt.target, stmt.key, stmt.text) == 0) {
      ++report.unmatched;
      DOCCAT_LOG_DEBUG("comment target not found", {observability::StringField("statement", stmt.ToSql())});
      continue;
    }
    ++report.applied;
    if (stmt.truncated) ++report.truncated;
  }

  tx.Commit();
  DOCCAT_LOG_INFO("native comments applied", {observability::IntField("applied", static_cast<std::int64_t>(report.applied)),
                                              observability::IntField("truncated", static_cast<std::int64_t>(report.truncated)),
                                              observability::IntField("unmatched", static_cast<std::int64_t>(report.unmatched))});
  return report;
}

} // namespace doccat::sync
