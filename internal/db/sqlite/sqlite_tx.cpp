#include "sqlite_tx.hpp"

#include <atomic>
#include <exception>

#include "internal/observability/logging.hpp"

namespace doccat::db::sqlite {

namespace {

std::string NextSavepointName() {
  static std::atomic<unsigned long> counter{0};
  return "doccat_sp_" + std::to_string(++counter);
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  if (db_->InTransaction()) {
    savepoint_ = NextSavepointName();
    db_->Exec("SAVEPOINT " + savepoint_ + ";");
  } else {
    db_->Exec("BEGIN IMMEDIATE;");
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      Rollback();
    } catch (const std::exception& e) {
      DOCCAT_LOG_WARN("Transaction rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (IsNested()) {
    db_->Exec("RELEASE " + savepoint_ + ";");
  } else {
    db_->Exec("COMMIT;");
  }
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  committed_ = true;
  if (IsNested()) {
    db_->Exec("ROLLBACK TO " + savepoint_ + ";");
    db_->Exec("RELEASE " + savepoint_ + ";");
  } else if (db_->InTransaction()) {
    db_->Exec("ROLLBACK;");
  }
}

} // namespace doccat::db::sqlite
