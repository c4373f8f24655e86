#include "internal/sync/comment_statement.hpp"

#include "internal/catalog/object_kind.hpp"
#include "internal/catalog/qualified_name.hpp"
#include "internal/util/utf8.hpp"

namespace doccat::sync {

EncodedComment EncodeComment(std::string_view comment) {
  if (util::Utf8Length(comment) <= catalog::kNativeCommentLimit) {
    return {std::string(comment), false};
  }
  std::string text(util::Utf8Prefix(comment, kTruncatedLength));
  text += kEllipsis;
  return {std::move(text), true};
}

std::string CommentStatement::Identifier() const {
  std::string identifier;
  for (std::size_t i = 0; i < key.size(); ++i) {
    if (i > 0) identifier += ".";
    identifier += catalog::QuoteIdentifier(key[i]);
  }
  return identifier;
}

std::string CommentStatement::ToSql() const {
  return "COMMENT ON " + target + " " + Identifier() + " IS " + catalog::QuoteLiteral(text);
}

} // namespace doccat::sync
