#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace permit::db::memory {

namespace {

bool MatchesFilter(const model::PermissionChange& change, const PermissionChangeFilter& filter) {
  switch (filter.status) {
    case StatusFilter::kPending:
      if (change.status_code.has_value()) return false;
      break;
    case StatusFilter::kProcessed:
      if (!change.status_code.has_value()) return false;
      break;
    case StatusFilter::kAll:
      break;
  }
  return !filter.realm_url || change.realm_url == *filter.realm_url;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertPermissionChange(Transaction& t, const model::PermissionChange& r) {
  auto& s = TX(t).Mutable();
  if (s.changes.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "permission change " + r.id);
  s.changes[r.id] = r;
  return Result::Ok();
}

std::optional<model::PermissionChange> MemoryRepository::GetPermissionChange(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.changes.find(id);
  if (it == s.changes.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PermissionChange> MemoryRepository::ListPermissionChanges(Transaction& t, const PermissionChangeFilter& filter) {
  const auto&                          s = TX(t).View();
  std::vector<model::PermissionChange> records;
  for (const auto& [_, record] : s.changes) {
    if (MatchesFilter(record, filter)) records.push_back(record);
  }

  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::SetStatus(Transaction& t, const StatusWrite& w) {
  auto& s  = TX(t).Mutable();
  auto  it = s.changes.find(w.id);
  if (it == s.changes.end()) return Result::Err(ErrorCode::NotFound, "permission change " + w.id);

  auto& record = it->second;
  if (record.status_code.has_value()) return Result::Err(ErrorCode::Conflict, "status already set for " + w.id);

  record.status_code    = w.status_code;
  record.status_message = w.status_message;
  if (w.updated_at) record.updated_at = *w.updated_at;
  return Result::Ok();
}

Result MemoryRepository::DeletePermissionChange(Transaction& t, const std::string& id) {
  TX(t).Mutable().changes.erase(id);
  return Result::Ok();
}

} // namespace permit::db::memory
