#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace permit::db::sqlite {

/*
  One BEGIN IMMEDIATE ... COMMIT/ROLLBACK span on the shared connection.

  Construction blocks until no other transaction is open on the same
  SqliteDB; the connection lock is released as soon as the span ends.
  IMMEDIATE takes the file write lock up front so the status write never
  has to upgrade a read lock held by another process.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  void Finish();

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> connection_lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace permit::db::sqlite
