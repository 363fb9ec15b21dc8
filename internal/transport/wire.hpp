#pragma once

#include "internal/model/permission_change.hpp"
#include "internal/transport/transport.hpp"
#include "permit/v1.hpp"

namespace permit::transport {

/*
  Protobuf wire encoding.

  Only the client-owned fields travel to the authority; status comes back
  as a separate StatusUpdate message.
*/

permit::v1::PermissionChange ToProto(const model::PermissionChange& change);

// Validates the decoded record; throws util::MalformedRequest.
model::PermissionChange FromProto(const permit::v1::PermissionChange& message);

permit::v1::StatusUpdate ToProto(const StatusUpdate& update);
StatusUpdate             FromProto(const permit::v1::StatusUpdate& message);

permit::v1::MergeDirective ToProto(model::MergeDirective directive);
model::MergeDirective      FromProto(permit::v1::MergeDirective directive);

} // namespace permit::transport
