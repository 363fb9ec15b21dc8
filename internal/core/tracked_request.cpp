#include "internal/core/tracked_request.hpp"

#include <utility>

namespace permit::core {

const char* ToString(ApplyOutcome outcome) {
  switch (outcome) {
    case ApplyOutcome::kApplied:
      return "applied";
    case ApplyOutcome::kDuplicate:
      return "duplicate";
    case ApplyOutcome::kConflict:
      return "conflict";
    case ApplyOutcome::kUnknownRequest:
      return "unknown_request";
  }
  return "unknown_request";
}

TrackedRequest::TrackedRequest(model::PermissionChange record, std::shared_ptr<const model::ErrorTaxonomy> taxonomy)
    : id_(record.id), record_(std::move(record)), view_(std::move(taxonomy)) {
  // Initial decode; nobody is subscribed yet so nothing is published.
  view_.Update(record_.status_code);
  notify::ChangeEvent discarded;
  view_.Publish(discarded);

  notifier_.AddDeriver(std::string(model::fields::kStatusCode), [this](notify::ChangeEvent& event) {
    std::lock_guard lock(mutex_);
    view_.Publish(event);
  });
}

model::PermissionChange TrackedRequest::Snapshot() const {
  std::lock_guard lock(mutex_);
  return record_;
}

std::optional<std::int32_t> TrackedRequest::StatusCode() const {
  std::lock_guard lock(mutex_);
  return record_.status_code;
}

std::optional<std::string> TrackedRequest::StatusMessage() const {
  std::lock_guard lock(mutex_);
  return record_.status_message;
}

model::ProcessingStatus TrackedRequest::Status() const {
  std::lock_guard lock(mutex_);
  return view_.Current().status;
}

std::optional<model::ErrorCode> TrackedRequest::Error() const {
  std::lock_guard lock(mutex_);
  return view_.Current().error;
}

model::DecodedStatus TrackedRequest::Decoded() const {
  std::lock_guard lock(mutex_);
  return view_.Current();
}

notify::SubscriptionToken TrackedRequest::Subscribe(std::string field, notify::ChangeNotifier::Observer observer) {
  return notifier_.Subscribe(std::move(field), std::move(observer));
}

notify::SubscriptionToken TrackedRequest::SubscribeAll(notify::ChangeNotifier::Observer observer) {
  return notifier_.SubscribeAll(std::move(observer));
}

bool TrackedRequest::Unsubscribe(notify::SubscriptionToken token) {
  return notifier_.Unsubscribe(token);
}

ApplyOutcome TrackedRequest::ApplyStatus(std::int32_t code, const std::string& message,
                                         std::optional<std::chrono::system_clock::time_point> updated_at) {
  // One batch at a time per request, so observers see batches in apply order.
  std::lock_guard apply_lock(apply_mutex_);

  notify::ChangeEvent event;
  event.object_id = id_;
  {
    std::lock_guard lock(mutex_);
    if (record_.status_code.has_value()) {
      return *record_.status_code == code ? ApplyOutcome::kDuplicate : ApplyOutcome::kConflict;
    }

    record_.status_code = code;
    view_.Update(record_.status_code);
    event.Add(model::fields::kStatusCode);

    if (record_.status_message != message) {
      record_.status_message = message;
      event.Add(model::fields::kStatusMessage);
    }

    if (updated_at && *updated_at != record_.updated_at) {
      record_.updated_at = *updated_at;
      event.Add(model::fields::kUpdatedAt);
    }
  }

  notifier_.Notify(std::move(event));
  return ApplyOutcome::kApplied;
}

} // namespace permit::core
