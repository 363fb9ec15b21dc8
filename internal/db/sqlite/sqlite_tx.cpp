#include "sqlite_tx.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace permit::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), connection_lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    PERMIT_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Finish() {
  finished_ = true;
  if (connection_lock_.owns_lock()) connection_lock_.unlock();
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("sqlite transaction already finished");
  }
  // On failure the span stays open; the destructor rolls it back.
  db_->Exec("COMMIT;");
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception&) {
    Finish();
    throw;
  }
  Finish();
}

} // namespace permit::db::sqlite
