#pragma once

namespace backoffice::db {

/*
  Abstract backend transaction.

  A record store call that touches several rows (a batched append, an
  update that reads then writes) runs inside one of these, so the call is
  all-or-nothing even though the store offers no multi-call transactions.

  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
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

} // namespace backoffice::db
