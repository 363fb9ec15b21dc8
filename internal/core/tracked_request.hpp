#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/core/status_view.hpp"
#include "internal/model/permission_change.hpp"
#include "internal/model/status.hpp"
#include "internal/notify/change_notifier.hpp"

namespace permit::core {

class PermissionClient;

enum class ApplyOutcome : std::uint8_t {
  kApplied = 0,
  kDuplicate = 1,       // same terminal code again; nothing changed
  kConflict = 2,        // different terminal code; stored value kept
  kUnknownRequest = 3,  // no such request in the store
};

const char* ToString(ApplyOutcome outcome);

/*
  Live, read-only view of one persisted request.

  Callers read fields and subscribe to changes. Only PermissionClient, acting
  for the authority, can write the status fields, and only once.
*/
class TrackedRequest {
 public:
  TrackedRequest(model::PermissionChange record, std::shared_ptr<const model::ErrorTaxonomy> taxonomy);

  TrackedRequest(const TrackedRequest&)            = delete;
  TrackedRequest& operator=(const TrackedRequest&) = delete;

  const std::string& Id() const {
    return id_;
  }

  model::PermissionChange Snapshot() const;

  std::optional<std::int32_t>     StatusCode() const;
  std::optional<std::string>      StatusMessage() const;
  model::ProcessingStatus         Status() const;
  std::optional<model::ErrorCode> Error() const;
  model::DecodedStatus            Decoded() const;

  // See notify::ChangeNotifier for ordering guarantees.
  notify::SubscriptionToken Subscribe(std::string field, notify::ChangeNotifier::Observer observer);
  notify::SubscriptionToken SubscribeAll(notify::ChangeNotifier::Observer observer);
  bool                      Unsubscribe(notify::SubscriptionToken token);

 private:
  friend class PermissionClient;

  ApplyOutcome ApplyStatus(std::int32_t code, const std::string& message,
                           std::optional<std::chrono::system_clock::time_point> updated_at);

  const std::string      id_;
  mutable std::mutex     mutex_;
  std::mutex             apply_mutex_;
  model::PermissionChange record_;
  StatusView             view_;
  notify::ChangeNotifier notifier_;
};

} // namespace permit::core
