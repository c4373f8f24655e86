#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace doccat::db::sqlite {

/*
  RAII prepared statement.

  Step() returns true while rows are available and throws on any result
  other than SQLITE_ROW / SQLITE_DONE. StepCode() hands back the raw code
  for callers that translate it into a db::Result.
*/
class SqliteStatement {
 public:
  SqliteStatement(sqlite3* db, const std::string& sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&)            = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  SqliteStatement(SqliteStatement&& other) noexcept;
  SqliteStatement& operator=(SqliteStatement&& other) noexcept;

  void BindText(int idx, std::string_view value);
  void BindOptionalText(int idx, const std::optional<std::string>& value);
  void BindInt64(int idx, std::int64_t value);
  void BindNull(int idx);

  bool Step();
  int  StepCode();

  bool                       IsNull(int col) const;
  std::string                ColumnText(int col) const;
  std::optional<std::string> ColumnOptionalText(int col) const;
  std::int64_t               ColumnInt64(int col) const;

  sqlite3_stmt* Handle() const {
    return stmt_;
  }

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace doccat::db::sqlite
