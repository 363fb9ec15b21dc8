#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace permit::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPermissionChange(Transaction&, const model::PermissionChange&) override;
  std::optional<model::PermissionChange> GetPermissionChange(Transaction&, const std::string&) override;
  std::vector<model::PermissionChange> ListPermissionChanges(Transaction&, const PermissionChangeFilter&) override;
  Result SetStatus(Transaction&, const StatusWrite&) override;
  Result DeletePermissionChange(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::PermissionChange> changes;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
