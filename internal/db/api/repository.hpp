#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/model/permission_change.hpp"

namespace permit::db {

/*
  Repository abstraction over the object store collaborator.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - id is a unique key: a second insert with the same id is AlreadyExists
  - SetStatus writes only while the stored statusCode is null; afterwards it
    returns Conflict and leaves the row untouched. This is the only write
    path for statusCode/statusMessage.
  - Reads return std::nullopt / an empty list only for absent rows; engine
    failures are thrown, never reported as "not found".
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Permission change requests
  // ---------------------------------------------------------------------

  virtual Result InsertPermissionChange(Transaction&, const model::PermissionChange&) = 0;

  virtual std::optional<model::PermissionChange> GetPermissionChange(Transaction&, const std::string& id) = 0;

  // Ordered by createdAt, then id.
  virtual std::vector<model::PermissionChange> ListPermissionChanges(Transaction&, const PermissionChangeFilter&) = 0;

  virtual Result SetStatus(Transaction&, const StatusWrite&) = 0;

  // Retention hook; removing a record does not notify anybody.
  virtual Result DeletePermissionChange(Transaction&, const std::string& id) = 0;
};

} // namespace permit::db
