#pragma once

namespace permit::db {

/*
  Unit of work against the permission store.

  Every Repository call takes one. Inserts and status writes become visible
  to other transactions only on Commit(); a transaction that is destroyed
  without Commit() is rolled back. Callers keep them short: the sqlite
  backend serializes transactions per connection, and the memory backend
  rejects a commit whose snapshot went stale.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  // Throws when the backend cannot make the writes durable.
  virtual void Commit() = 0;

  // No-op after Commit() or an earlier Rollback().
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace permit::db
