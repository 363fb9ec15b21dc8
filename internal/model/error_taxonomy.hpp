#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace permit::model {

/*
  Error kinds the authority may report in statusCode.

  kUnknown is what any code outside the table decodes to; the raw code is
  kept next to it (see ErrorCode in status.hpp).
*/
enum class ErrorKind : std::uint16_t {
  kUnknown = 0,

  kInvalidParameters,
  kMissingParameters,
  kInvalidCredentials,
  kUnknownAccount,
  kExistingAccount,
  kAccessDenied,
  kExpiredRefreshToken,
  kInvalidHost,
  kRealmNotFound,
  kUnknownUser,

  kExpiredPermissionOffer,
  kAmbiguousPermissionOffer,
  kFileMayNotBeShared,

  kServerMisconfiguration,
};

std::string_view ToString(ErrorKind kind);
std::optional<ErrorKind> ParseErrorKind(std::string_view name);

/*
  Versioned code -> kind table.

  The authority's code space evolves independently of the client, so
  Lookup() is total: unregistered codes map to kUnknown.
*/
class ErrorTaxonomy {
 public:
  static constexpr std::uint32_t kBuiltinVersion = 1;

  ErrorTaxonomy() = default;

  // Table shipped with this client.
  static const ErrorTaxonomy& Builtin();

  ErrorKind Lookup(std::int32_t code) const noexcept;
  bool      Contains(std::int32_t code) const;

  // Adds or replaces an entry. Code 0 means success and cannot be registered.
  bool Register(std::int32_t code, ErrorKind kind);

  std::uint32_t Version() const {
    return version_;
  }
  void SetVersion(std::uint32_t version) {
    version_ = version;
  }

  std::size_t Size() const {
    return codes_.size();
  }

 private:
  std::uint32_t                             version_ = 0;
  std::unordered_map<std::int32_t, ErrorKind> codes_;
};

}  // namespace permit::model
