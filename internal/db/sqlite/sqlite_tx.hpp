#pragma once

#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace doccat::db::sqlite {

/*
  SQLite transaction wrapper.

  Outermost transaction uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  A transaction opened while another is active becomes a named SAVEPOINT,
  so an operation can be called on its own or as a step of a larger one.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

  bool IsNested() const { return !savepoint_.empty(); }

private:
  std::shared_ptr<SqliteDB> db_;
  std::string savepoint_;
  bool committed_ = false;
};

}
