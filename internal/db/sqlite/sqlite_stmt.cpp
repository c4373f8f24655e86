#include "sqlite_stmt.hpp"

#include <stdexcept>
#include <utility>

namespace doccat::db::sqlite {

SqliteStatement::SqliteStatement(sqlite3* db, const std::string& sql) : db_(db) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = std::string("sqlite prepare: ") + sqlite3_errmsg(db_);
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw std::runtime_error(msg);
  }
}

SqliteStatement::~SqliteStatement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {
}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
  if (this != &other) {
    if (stmt_) sqlite3_finalize(stmt_);
    db_   = other.db_;
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

void SqliteStatement::BindText(int idx, std::string_view value) {
  sqlite3_bind_text(stmt_, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void SqliteStatement::BindOptionalText(int idx, const std::optional<std::string>& value) {
  if (value.has_value()) {
    BindText(idx, *value);
  } else {
    BindNull(idx);
  }
}

void SqliteStatement::BindInt64(int idx, std::int64_t value) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
}

void SqliteStatement::BindNull(int idx) {
  sqlite3_bind_null(stmt_, idx);
}

int SqliteStatement::StepCode() {
  return sqlite3_step(stmt_);
}

bool SqliteStatement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
}

bool SqliteStatement::IsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::string SqliteStatement::ColumnText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::optional<std::string> SqliteStatement::ColumnOptionalText(int col) const {
  if (IsNull(col)) return std::nullopt;
  return ColumnText(col);
}

std::int64_t SqliteStatement::ColumnInt64(int col) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

} // namespace doccat::db::sqlite
