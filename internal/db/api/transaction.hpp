#pragma once

namespace outbox::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::ConcurrencyConflict when a row this
    transaction depended on was changed by another transaction

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: write overlay + journal applied on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;
};

}
