#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/tracked_request.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/error_taxonomy.hpp"
#include "internal/model/permission_change.hpp"
#include "internal/transport/transport.hpp"

namespace permit::core {

struct ClientOptions {
  // updatedAt policy: false keeps the creation time forever.
  bool refresh_updated_at_on_status = false;
};

/*
  Client side of the permission change protocol.

  CreateForUser, CreateForMetadata and Submit persist a request and hand it
  to the transport. Status updates arriving from the transport are written
  to the store once and then applied to the tracked request, which notifies
  its observers.
*/
class PermissionClient {
 public:
  PermissionClient(std::shared_ptr<db::Repository> repository, std::shared_ptr<transport::Transport> transport,
                   std::shared_ptr<const model::ErrorTaxonomy> taxonomy, ClientOptions options = {});
  ~PermissionClient();

  PermissionClient(const PermissionClient&)            = delete;
  PermissionClient& operator=(const PermissionClient&) = delete;

  std::shared_ptr<TrackedRequest> CreateForUser(std::string user_id, std::string realm_url,
                                                model::MergeDirective may_read   = model::MergeDirective::kUnspecified,
                                                model::MergeDirective may_write  = model::MergeDirective::kUnspecified,
                                                model::MergeDirective may_manage = model::MergeDirective::kUnspecified);

  std::shared_ptr<TrackedRequest> CreateForMetadata(std::string key, std::string value, std::string realm_url,
                                                    model::MergeDirective may_read   = model::MergeDirective::kUnspecified,
                                                    model::MergeDirective may_write  = model::MergeDirective::kUnspecified,
                                                    model::MergeDirective may_manage = model::MergeDirective::kUnspecified);

  // Persists and transmits an already constructed request.
  // Throws util::MalformedRequest, util::AlreadyExists or util::InvalidState.
  std::shared_ptr<TrackedRequest> Submit(model::PermissionChange change);

  // Tracked instance for id, loading it from the store if needed. nullptr if unknown.
  std::shared_ptr<TrackedRequest> Find(const std::string& id);

  std::vector<model::PermissionChange> List(const db::PermissionChangeFilter& filter = {});

  // Entry point for the transport. Authority outcomes, duplicates and unknown
  // ids come back as ApplyOutcome; only store failures throw.
  ApplyOutcome OnStatusUpdate(const transport::StatusUpdate& update);

  // Re-tracks and resubmits every request still pending in the store.
  // A request the transport refuses is logged and left pending for the next
  // call. Returns how many were handed to the transport.
  std::size_t Resume();

  // Stops tracking id; the stored record is untouched.
  void Forget(const std::string& id);

  std::size_t TrackedCount() const;

  const model::ErrorTaxonomy& Taxonomy() const {
    return *taxonomy_;
  }

 private:
  std::shared_ptr<TrackedRequest> Track(model::PermissionChange record);

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<transport::Transport>       transport_;
  std::shared_ptr<const model::ErrorTaxonomy> taxonomy_;
  ClientOptions                               options_;

  // Serializes store writes; the memory backend rejects overlapping commits.
  std::mutex write_mutex_;

  mutable std::mutex                                               tracked_mutex_;
  std::unordered_map<std::string, std::shared_ptr<TrackedRequest>> tracked_;
};

} // namespace permit::core
