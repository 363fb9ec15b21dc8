#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace permit::db {

using TimePoint = std::chrono::system_clock::time_point;

enum class StatusFilter {
  kAll,
  kPending,    // statusCode is null
  kProcessed,  // statusCode is set
};

struct PermissionChangeFilter {
  StatusFilter status = StatusFilter::kAll;
  std::optional<std::string> realm_url;
};

// Terminal write performed by the authority side.
struct StatusWrite {
  std::string id;
  std::int32_t status_code = 0;
  std::string status_message;
  // Set only when the updatedAt refresh policy is enabled.
  std::optional<TimePoint> updated_at;
};

} // namespace permit::db
