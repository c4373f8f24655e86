#pragma once

namespace doccat::db {

/*
  Abstract transaction.

  Semantics:

  - Changes are invisible to other connections until Commit()
  - Rollback() discards all writes made through this transaction
  - Destructor MUST rollback if not committed
  - Opening a transaction while another one is active nests it
    (savepoint); committing the inner one only releases the savepoint

  SQLite: BEGIN IMMEDIATE / SAVEPOINT
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

}
