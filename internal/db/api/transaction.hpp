#pragma once

namespace keyshop::db {

/*
  Unit of work over the ledger, guard and credential tables.

  Every backend promises:

  - nothing written inside the transaction is visible to others before Commit()
  - a conditional write (pending -> paid, claim insert, missing_since check)
    decides against the state it will commit, so two transactions never both
    win the same row
  - a transaction destroyed without Commit() leaves no trace

  SQLite keeps one writer via BEGIN IMMEDIATE, Postgres relies on row locks
  taken by conditional UPDATE/INSERT, and the memory backend compares the
  store version at commit time.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // throws DatabaseError (SerializationFailure is retryable)
  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
