#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace permit::db::sqlite {

/*
  Owns one sqlite3 connection to the permission store.

  The connection carries a single transaction at a time, so every
  SqliteTransaction holds TxMutex() from BEGIN until COMMIT/ROLLBACK.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Journal mode, sync level and busy timeout for the store file.
  void Configure(bool wal_mode);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  std::mutex  tx_mutex_;
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace permit::db::sqlite
