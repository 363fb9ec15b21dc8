#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace permit::model {

/*
  What a request asks for one capability.

  kUnspecified is not "false": the authority merges it with the existing
  (or default) value, which as a side effect materializes that default.
*/
enum class MergeDirective : std::uint8_t {
  kUnspecified = 0,
  kGrant = 1,
  kRevoke = 2,
};

constexpr MergeDirective FromOptional(std::optional<bool> value) {
  if (!value.has_value()) {
    return MergeDirective::kUnspecified;
  }
  return *value ? MergeDirective::kGrant : MergeDirective::kRevoke;
}

constexpr std::optional<bool> ToOptional(MergeDirective directive) {
  switch (directive) {
    case MergeDirective::kGrant:
      return true;
    case MergeDirective::kRevoke:
      return false;
    case MergeDirective::kUnspecified:
      break;
  }
  return std::nullopt;
}

constexpr bool Resolve(MergeDirective directive, bool existing) {
  switch (directive) {
    case MergeDirective::kGrant:
      return true;
    case MergeDirective::kRevoke:
      return false;
    case MergeDirective::kUnspecified:
      break;
  }
  return existing;
}

std::string_view ToString(MergeDirective directive);

// Accepts "grant", "revoke", "unspecified" (and true/false/null spellings).
std::optional<MergeDirective> ParseMergeDirective(std::string_view text);

struct PermissionSet {
  bool may_read = false;
  bool may_write = false;
  bool may_manage = false;

  bool operator==(const PermissionSet&) const = default;
};

}  // namespace permit::model
