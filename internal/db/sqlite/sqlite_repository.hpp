#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace permit::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPermissionChange(Transaction&, const model::PermissionChange&) override;
  std::optional<model::PermissionChange> GetPermissionChange(Transaction&, const std::string&) override;
  std::vector<model::PermissionChange> ListPermissionChanges(Transaction&, const PermissionChangeFilter&) override;
  Result SetStatus(Transaction&, const StatusWrite&) override;
  Result DeletePermissionChange(Transaction&, const std::string&) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
