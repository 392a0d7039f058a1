#pragma once

namespace upload::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - A thread must not open a second transaction while one is live

  SQLite: BEGIN IMMEDIATE, serialized per connection
  Postgres: pqxx::work, row locks via SELECT ... FOR UPDATE
  Memory: snapshot + write set, one writer at a time
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once committed or rolled back
  virtual bool IsCommitted() const = 0;
};

}
