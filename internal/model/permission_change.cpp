#include "internal/model/permission_change.hpp"

#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace permit::model {

namespace {

PermissionChange NewRecord(MergeDirective may_read, MergeDirective may_write, MergeDirective may_manage) {
  PermissionChange change;
  change.id         = util::NewId();
  change.created_at = util::Now();
  change.updated_at = change.created_at;
  change.may_read   = may_read;
  change.may_write  = may_write;
  change.may_manage = may_manage;
  return change;
}

}  // namespace

std::string_view ToString(MergeDirective directive) {
  switch (directive) {
    case MergeDirective::kGrant:
      return "grant";
    case MergeDirective::kRevoke:
      return "revoke";
    case MergeDirective::kUnspecified:
      break;
  }
  return "unspecified";
}

std::optional<MergeDirective> ParseMergeDirective(std::string_view text) {
  if (text == "grant" || text == "true") return MergeDirective::kGrant;
  if (text == "revoke" || text == "false") return MergeDirective::kRevoke;
  if (text == "unspecified" || text == "null") return MergeDirective::kUnspecified;
  return std::nullopt;
}

PermissionChange CreateForUser(std::string user_id, std::string realm_url, MergeDirective may_read, MergeDirective may_write,
                               MergeDirective may_manage) {
  auto change      = NewRecord(may_read, may_write, may_manage);
  change.user_id   = std::move(user_id);
  change.realm_url = std::move(realm_url);
  Validate(change);
  return change;
}

PermissionChange CreateForMetadata(std::string key, std::string value, std::string realm_url, MergeDirective may_read,
                                   MergeDirective may_write, MergeDirective may_manage) {
  auto change           = NewRecord(may_read, may_write, may_manage);
  change.metadata_key   = std::move(key);
  change.metadata_value = std::move(value);
  change.user_id        = std::string();
  change.realm_url      = std::move(realm_url);
  Validate(change);
  return change;
}

void Validate(const PermissionChange& change) {
  if (!util::IsCanonical(change.id)) {
    throw util::MalformedRequest("permission change id is not a UUID: '" + change.id + "'");
  }
  if (change.realm_url.empty()) {
    throw util::MalformedRequest("permission change " + change.id + " has no realm url");
  }

  const bool has_key   = change.metadata_key.has_value();
  const bool has_value = change.metadata_value.has_value();
  if (has_key != has_value) {
    throw util::MalformedRequest("permission change " + change.id + " sets only one of metadata key/value");
  }

  if (has_key) {
    if (!change.user_id.empty()) {
      throw util::MalformedRequest("permission change " + change.id + " mixes user and metadata targeting");
    }
    if (change.metadata_key->empty() || change.metadata_value->empty()) {
      throw util::MalformedRequest("permission change " + change.id + " has an empty metadata key or value");
    }
    return;
  }

  if (change.user_id.empty()) {
    throw util::MalformedRequest("permission change " + change.id + " targets neither a user nor metadata");
  }
}

PermissionSet MergeInto(const PermissionSet& existing, const PermissionChange& change) {
  PermissionSet merged;
  merged.may_read   = Resolve(change.may_read, existing.may_read);
  merged.may_write  = Resolve(change.may_write, existing.may_write);
  merged.may_manage = Resolve(change.may_manage, existing.may_manage);
  return merged;
}

}  // namespace permit::model
