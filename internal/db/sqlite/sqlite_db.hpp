#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace doccat::db::sqlite {

struct SqliteOptions {
  int  busy_timeout_ms = 5000;
  bool wal_mode        = true;
};

/*
  Thin RAII wrapper around sqlite3*.

  Every doccat namespace lives in this one database: SQLite views and
  triggers cannot reference objects of another attached database.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (DDL, pragmas, transaction control)
  void Exec(const std::string& sql);

  // true while an explicit transaction is open on this connection
  bool InTransaction() const;

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace doccat::db::sqlite
