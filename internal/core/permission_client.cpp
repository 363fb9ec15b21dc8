#include "internal/core/permission_client.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/transport/wire.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace permit::core {

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(std::string(db::ToString(result.code)) + ": " + message);
  }
}

std::string TargetDescription(const model::PermissionChange& change) {
  if (change.Mode() == model::TargetMode::kMetadata) {
    return *change.metadata_key + "=" + *change.metadata_value;
  }
  return change.user_id;
}

} // namespace

PermissionClient::PermissionClient(std::shared_ptr<db::Repository> repository, std::shared_ptr<transport::Transport> transport,
                                   std::shared_ptr<const model::ErrorTaxonomy> taxonomy, ClientOptions options)
    : repository_(std::move(repository)), transport_(std::move(transport)), taxonomy_(std::move(taxonomy)), options_(options) {
  if (!repository_ || !transport_ || !taxonomy_) {
    throw std::invalid_argument("PermissionClient requires a repository, a transport and a taxonomy");
  }
  transport_->SetUpdateHandler([this](const transport::StatusUpdate& update) { OnStatusUpdate(update); });
}

PermissionClient::~PermissionClient() {
  transport_->SetUpdateHandler(nullptr);
}

std::shared_ptr<TrackedRequest> PermissionClient::CreateForUser(std::string user_id, std::string realm_url, model::MergeDirective may_read,
                                                                model::MergeDirective may_write, model::MergeDirective may_manage) {
  return Submit(model::CreateForUser(std::move(user_id), std::move(realm_url), may_read, may_write, may_manage));
}

std::shared_ptr<TrackedRequest> PermissionClient::CreateForMetadata(std::string key, std::string value, std::string realm_url,
                                                                    model::MergeDirective may_read, model::MergeDirective may_write,
                                                                    model::MergeDirective may_manage) {
  return Submit(model::CreateForMetadata(std::move(key), std::move(value), std::move(realm_url), may_read, may_write, may_manage));
}

std::shared_ptr<TrackedRequest> PermissionClient::Submit(model::PermissionChange change) {
  model::Validate(change);
  if (change.IsProcessed()) {
    throw util::InvalidState("permission change " + change.id + " already carries a status");
  }

  {
    std::lock_guard lock(write_mutex_);
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertPermissionChange(*tx, change), "insert permission change " + change.id);
    tx->Commit();
  }

  auto tracked = Track(change);

  PERMIT_LOG_INFO("permission change submitted",
                  {StringField("id", change.id), StringField("target", TargetDescription(change)), StringField("realm_url", change.realm_url),
                   StringField("may_read", model::ToString(change.may_read)), StringField("may_write", model::ToString(change.may_write)),
                   StringField("may_manage", model::ToString(change.may_manage))});

  try {
    transport_->Submit(transport::ToProto(change));
  } catch (const std::exception& e) {
    // Stays pending in the store; Resume() retries it.
    PERMIT_LOG_ERROR("permission change transport failed", {StringField("id", change.id), StringField("error", e.what())});
    throw;
  }

  return tracked;
}

std::shared_ptr<TrackedRequest> PermissionClient::Track(model::PermissionChange record) {
  std::lock_guard lock(tracked_mutex_);
  auto            it = tracked_.find(record.id);
  if (it != tracked_.end()) {
    return it->second;
  }
  const auto id      = record.id;
  auto       tracked = std::make_shared<TrackedRequest>(std::move(record), taxonomy_);
  tracked_.emplace(id, tracked);
  return tracked;
}

std::shared_ptr<TrackedRequest> PermissionClient::Find(const std::string& id) {
  {
    std::lock_guard lock(tracked_mutex_);
    auto            it = tracked_.find(id);
    if (it != tracked_.end()) return it->second;
  }

  std::optional<model::PermissionChange> record;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetPermissionChange(*tx, id);
    tx->Rollback();
  }
  if (!record) return nullptr;

  model::Validate(*record);
  return Track(std::move(*record));
}

std::vector<model::PermissionChange> PermissionClient::List(const db::PermissionChangeFilter& filter) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListPermissionChanges(*tx, filter);
  tx->Rollback();
  return records;
}

ApplyOutcome PermissionClient::OnStatusUpdate(const transport::StatusUpdate& update) {
  std::shared_ptr<TrackedRequest> tracked;
  try {
    tracked = Find(update.id);
  } catch (const util::MalformedRequest& e) {
    PERMIT_LOG_ERROR("stored permission change is malformed", {StringField("id", update.id), StringField("error", e.what())});
    return ApplyOutcome::kUnknownRequest;
  }

  if (!tracked) {
    PERMIT_LOG_WARN("status update for unknown permission change",
                    {StringField("id", update.id), IntField("status_code", update.status_code)});
    return ApplyOutcome::kUnknownRequest;
  }

  db::StatusWrite write;
  write.id             = update.id;
  write.status_code    = update.status_code;
  write.status_message = update.status_message;
  if (options_.refresh_updated_at_on_status) {
    write.updated_at = util::Now();
  }

  db::Result                             result;
  std::optional<model::PermissionChange> stored;
  {
    std::lock_guard lock(write_mutex_);
    auto            tx = repository_->Begin();
    result             = repository_->SetStatus(*tx, write);
    if (result) {
      tx->Commit();
    } else {
      if (result.code == db::ErrorCode::Conflict) stored = repository_->GetPermissionChange(*tx, update.id);
      tx->Rollback();
    }
  }

  if (result) {
    tracked->ApplyStatus(write.status_code, write.status_message, write.updated_at);
    PERMIT_LOG_INFO("permission change processed", {StringField("id", update.id), IntField("status_code", update.status_code),
                                                    StringField("status", model::Describe(tracked->Decoded()))});
    return ApplyOutcome::kApplied;
  }

  if (result.code == db::ErrorCode::NotFound) {
    // Pruned between lookup and write.
    Forget(update.id);
    PERMIT_LOG_WARN("status update for unknown permission change",
                    {StringField("id", update.id), IntField("status_code", update.status_code)});
    return ApplyOutcome::kUnknownRequest;
  }

  if (result.code != db::ErrorCode::Conflict) {
    ThrowIfDbError(result, "set status for " + update.id);
  }

  if (stored && stored->status_code && !tracked->StatusCode()) {
    // Written by another process sharing the store.
    tracked->ApplyStatus(*stored->status_code, stored->status_message.value_or(std::string()), stored->updated_at);
  }

  const auto stored_code = stored ? stored->status_code : std::nullopt;
  if (stored_code && *stored_code == update.status_code) {
    PERMIT_LOG_DEBUG("duplicate status update ignored", {StringField("id", update.id), IntField("status_code", update.status_code)});
    return ApplyOutcome::kDuplicate;
  }

  PERMIT_LOG_WARN("conflicting status update ignored", {StringField("id", update.id), IntField("status_code", update.status_code),
                                                        IntField("stored_status_code", stored_code.value_or(0))});
  return ApplyOutcome::kConflict;
}

std::size_t PermissionClient::Resume() {
  const auto pending = List({db::StatusFilter::kPending, std::nullopt});

  std::size_t resubmitted = 0;
  for (const auto& record : pending) {
    try {
      model::Validate(record);
    } catch (const util::MalformedRequest& e) {
      PERMIT_LOG_ERROR("skipping malformed stored permission change", {StringField("id", record.id), StringField("error", e.what())});
      continue;
    }

    Track(record);
    try {
      transport_->Submit(transport::ToProto(record));
    } catch (const std::exception& e) {
      // Still pending; the next Resume() picks it up again.
      PERMIT_LOG_ERROR("permission change resubmit failed", {StringField("id", record.id), StringField("error", e.what())});
      continue;
    }
    ++resubmitted;
  }

  PERMIT_LOG_INFO("pending permission changes resubmitted", {IntField("count", static_cast<std::int64_t>(resubmitted)),
                                                             IntField("pending", static_cast<std::int64_t>(pending.size()))});
  return resubmitted;
}

void PermissionClient::Forget(const std::string& id) {
  std::lock_guard lock(tracked_mutex_);
  tracked_.erase(id);
}

std::size_t PermissionClient::TrackedCount() const {
  std::lock_guard lock(tracked_mutex_);
  return tracked_.size();
}

} // namespace permit::core
