#pragma once

namespace pagewise::db {

/*
  Unit of work over one reader's progress.

  A progress record, its medium rows, the ledger rows an update appends and
  the completion row of a finish are written through one Transaction and
  become visible together on Commit(). Readers never observe a percent
  change without the ledger rows that paid for it.

  Backends:
    memory - snapshot taken at Begin(), version checked per record on commit
    sqlite - BEGIN IMMEDIATE on a connection held for the transaction's life

  An uncommitted transaction is rolled back by its destructor. Commit() on a
  finished transaction throws.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace pagewise::db
