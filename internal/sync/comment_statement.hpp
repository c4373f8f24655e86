#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace doccat::sync {

// kept text plus marker fits the native ceiling exactly
inline constexpr std::size_t      kTruncatedLength = 251;
inline constexpr std::string_view kEllipsis        = "...";

struct EncodedComment {
  std::string text;
  bool        truncated = false;
};

/*
  Fits a comment into the native ceiling: up to 254 code points verbatim,
  otherwise the first 251 code points followed by "...".
*/
EncodedComment EncodeComment(std::string_view comment);

/*
  One COMMENT ON statement. text holds the comment as it will be stored
  (already truncated); ToSql() renders it with quotes doubled.
*/
struct CommentStatement {
  std::string              kind_table;
  std::string              target;
  std::vector<std::string> key;
  std::string              text;
  bool                     truncated = false;

  // key parts double-quoted and joined by '.'
  std::string Identifier() const;

  std::string ToSql() const;

  bool operator==(const CommentStatement& other) const = default;
};

} // namespace doccat::sync
