#include "internal/transport/wire.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace permit::transport {

permit::v1::MergeDirective ToProto(model::MergeDirective directive) {
  switch (directive) {
    case model::MergeDirective::kGrant:
      return permit::v1::MERGE_DIRECTIVE_GRANT;
    case model::MergeDirective::kRevoke:
      return permit::v1::MERGE_DIRECTIVE_REVOKE;
    case model::MergeDirective::kUnspecified:
      break;
  }
  return permit::v1::MERGE_DIRECTIVE_UNSPECIFIED;
}

model::MergeDirective FromProto(permit::v1::MergeDirective directive) {
  switch (directive) {
    case permit::v1::MERGE_DIRECTIVE_GRANT:
      return model::MergeDirective::kGrant;
    case permit::v1::MERGE_DIRECTIVE_REVOKE:
      return model::MergeDirective::kRevoke;
    default:
      return model::MergeDirective::kUnspecified;
  }
}

permit::v1::PermissionChange ToProto(const model::PermissionChange& change) {
  permit::v1::PermissionChange message;
  message.set_id(change.id);
  *message.mutable_created_at() = util::ToProto(change.created_at);
  *message.mutable_updated_at() = util::ToProto(change.updated_at);

  if (change.Mode() == model::TargetMode::kMetadata) {
    auto* target = message.mutable_metadata();
    target->set_key(change.metadata_key.value_or(std::string()));
    target->set_value(change.metadata_value.value_or(std::string()));
  } else {
    message.mutable_user()->set_user_id(change.user_id);
  }

  message.set_realm_url(change.realm_url);
  message.set_may_read(ToProto(change.may_read));
  message.set_may_write(ToProto(change.may_write));
  message.set_may_manage(ToProto(change.may_manage));
  return message;
}

model::PermissionChange FromProto(const permit::v1::PermissionChange& message) {
  model::PermissionChange change;
  change.id         = message.id();
  change.created_at = util::FromProto(message.created_at());
  change.updated_at = util::FromProto(message.updated_at());

  switch (message.target_case()) {
    case permit::v1::PermissionChange::kUser:
      change.user_id = message.user().user_id();
      break;
    case permit::v1::PermissionChange::kMetadata:
      change.metadata_key   = message.metadata().key();
      change.metadata_value = message.metadata().value();
      break;
    default:
      throw util::MalformedRequest("permission change " + message.id() + " has no target");
  }

  change.realm_url  = message.realm_url();
  change.may_read   = FromProto(message.may_read());
  change.may_write  = FromProto(message.may_write());
  change.may_manage = FromProto(message.may_manage());

  model::Validate(change);
  return change;
}

permit::v1::StatusUpdate ToProto(const StatusUpdate& update) {
  permit::v1::StatusUpdate message;
  message.set_id(update.id);
  message.set_status_code(update.status_code);
  message.set_status_message(update.status_message);
  return message;
}

StatusUpdate FromProto(const permit::v1::StatusUpdate& message) {
  return {message.id(), message.status_code(), message.status_message()};
}

} // namespace permit::transport
