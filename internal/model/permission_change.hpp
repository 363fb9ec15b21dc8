#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/merge_directive.hpp"

namespace permit::model {

// Wildcards accepted for user_id and realm_url.
inline constexpr std::string_view kAllUsers  = "*";
inline constexpr std::string_view kAllRealms = "*";

// Persistent field names, used as change notification keys.
namespace fields {
inline constexpr std::string_view kId            = "id";
inline constexpr std::string_view kCreatedAt     = "createdAt";
inline constexpr std::string_view kUpdatedAt     = "updatedAt";
inline constexpr std::string_view kStatusCode    = "statusCode";
inline constexpr std::string_view kStatusMessage = "statusMessage";
inline constexpr std::string_view kUserId        = "userId";
inline constexpr std::string_view kMetadataKey   = "metadataKey";
inline constexpr std::string_view kMetadataValue = "metadataValue";
inline constexpr std::string_view kRealmUrl      = "realmUrl";
inline constexpr std::string_view kMayRead       = "mayRead";
inline constexpr std::string_view kMayWrite      = "mayWrite";
inline constexpr std::string_view kMayManage     = "mayManage";

// derived
inline constexpr std::string_view kStatus    = "status";
inline constexpr std::string_view kErrorCode = "errorCode";
}  // namespace fields

enum class TargetMode : std::uint8_t {
  kUser = 0,
  kMetadata = 1,
};

/*
  One requested permission mutation.

  Created by the requesting side only, through CreateForUser/CreateForMetadata.
  status_code/status_message belong to the authority and start out empty.
*/
struct PermissionChange {
  std::string id;
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point updated_at{};

  std::optional<std::int32_t> status_code;
  std::optional<std::string> status_message;

  // Empty (not "*") in metadata mode.
  std::string user_id;
  std::optional<std::string> metadata_key;
  std::optional<std::string> metadata_value;

  std::string realm_url;

  MergeDirective may_read = MergeDirective::kUnspecified;
  MergeDirective may_write = MergeDirective::kUnspecified;
  MergeDirective may_manage = MergeDirective::kUnspecified;

  TargetMode Mode() const {
    return metadata_key.has_value() ? TargetMode::kMetadata : TargetMode::kUser;
  }

  bool IsProcessed() const {
    return status_code.has_value();
  }
};

PermissionChange CreateForUser(std::string user_id, std::string realm_url,
                               MergeDirective may_read = MergeDirective::kUnspecified,
                               MergeDirective may_write = MergeDirective::kUnspecified,
                               MergeDirective may_manage = MergeDirective::kUnspecified);

PermissionChange CreateForMetadata(std::string key, std::string value, std::string realm_url,
                                   MergeDirective may_read = MergeDirective::kUnspecified,
                                   MergeDirective may_write = MergeDirective::kUnspecified,
                                   MergeDirective may_manage = MergeDirective::kUnspecified);

// Throws util::MalformedRequest unless exactly one targeting mode is populated,
// realm_url is set and the id is a canonical UUID.
void Validate(const PermissionChange& change);

// Effect of the request's directives on an existing permission set.
PermissionSet MergeInto(const PermissionSet& existing, const PermissionChange& change);

}  // namespace permit::model
