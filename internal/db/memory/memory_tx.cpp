#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

namespace permit::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (committed_ || discarded_) {
    throw std::runtime_error("memory transaction is no longer open");
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw std::runtime_error("memory store moved from version " + std::to_string(base_version_) + " to " +
                             std::to_string(repo_.committed_version_) + " during the transaction");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  if (committed_ || discarded_) return;
  // Nothing reached the store.
  working_.changes.clear();
  discarded_ = true;
}

} // namespace permit::db::memory
