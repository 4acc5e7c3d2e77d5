#pragma once

namespace siros::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::Conflict when a concurrent writer won,
    util::PersistenceFailed on any other backend failure

  SQLite: BEGIN IMMEDIATE (writers), BEGIN DEFERRED (readers)
  Postgres: pqxx::work / pqxx::read_transaction
  Memory: snapshot copy + per-key version check
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace siros::db
