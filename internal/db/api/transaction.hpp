#pragma once

namespace gaitrank::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  One race is applied inside exactly one transaction, so a race either
  lands completely (beliefs, history, audit rows) or not at all.

  SQLite: BEGIN IMMEDIATE, serialized on the shared connection
  Postgres: pqxx::work
  Memory: snapshot copy-on-write
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

} // namespace gaitrank::db
