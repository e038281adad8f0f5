#pragma once

namespace impact::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE, connection held exclusively
  Postgres: pqxx::work
  Memory: snapshot copy, version check on commit
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

} // namespace impact::db
