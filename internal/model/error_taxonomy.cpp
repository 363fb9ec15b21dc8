#include "internal/model/error_taxonomy.hpp"

#include <array>
#include <utility>

namespace permit::model {

namespace {

struct KindName {
  ErrorKind        kind;
  std::string_view name;
};

constexpr std::array<KindName, 15> kKindNames{{
    {ErrorKind::kUnknown, "unknown"},
    {ErrorKind::kInvalidParameters, "invalid_parameters"},
    {ErrorKind::kMissingParameters, "missing_parameters"},
    {ErrorKind::kInvalidCredentials, "invalid_credentials"},
    {ErrorKind::kUnknownAccount, "unknown_account"},
    {ErrorKind::kExistingAccount, "existing_account"},
    {ErrorKind::kAccessDenied, "access_denied"},
    {ErrorKind::kExpiredRefreshToken, "expired_refresh_token"},
    {ErrorKind::kInvalidHost, "invalid_host"},
    {ErrorKind::kRealmNotFound, "realm_not_found"},
    {ErrorKind::kUnknownUser, "unknown_user"},
    {ErrorKind::kExpiredPermissionOffer, "expired_permission_offer"},
    {ErrorKind::kAmbiguousPermissionOffer, "ambiguous_permission_offer"},
    {ErrorKind::kFileMayNotBeShared, "file_may_not_be_shared"},
    {ErrorKind::kServerMisconfiguration, "server_misconfiguration"},
}};

constexpr std::array<std::pair<std::int32_t, ErrorKind>, 14> kBuiltinCodes{{
    {601, ErrorKind::kInvalidParameters},
    {602, ErrorKind::kMissingParameters},
    {611, ErrorKind::kInvalidCredentials},
    {612, ErrorKind::kUnknownAccount},
    {613, ErrorKind::kExistingAccount},
    {614, ErrorKind::kAccessDenied},
    {615, ErrorKind::kExpiredRefreshToken},
    {616, ErrorKind::kInvalidHost},
    {617, ErrorKind::kRealmNotFound},
    {618, ErrorKind::kUnknownUser},
    {701, ErrorKind::kExpiredPermissionOffer},
    {702, ErrorKind::kAmbiguousPermissionOffer},
    {703, ErrorKind::kFileMayNotBeShared},
    {801, ErrorKind::kServerMisconfiguration},
}};

}  // namespace

std::string_view ToString(ErrorKind kind) {
  for (const auto& entry : kKindNames) {
    if (entry.kind == kind) return entry.name;
  }
  return "unknown";
}

std::optional<ErrorKind> ParseErrorKind(std::string_view name) {
  for (const auto& entry : kKindNames) {
    if (entry.name == name) return entry.kind;
  }
  return std::nullopt;
}

const ErrorTaxonomy& ErrorTaxonomy::Builtin() {
  static const ErrorTaxonomy taxonomy = [] {
    ErrorTaxonomy t;
    t.SetVersion(kBuiltinVersion);
    for (const auto& [code, kind] : kBuiltinCodes) {
      t.Register(code, kind);
    }
    return t;
  }();
  return taxonomy;
}

ErrorKind ErrorTaxonomy::Lookup(std::int32_t code) const noexcept {
  auto it = codes_.find(code);
  if (it == codes_.end()) return ErrorKind::kUnknown;
  return it->second;
}

bool ErrorTaxonomy::Contains(std::int32_t code) const {
  return codes_.find(code) != codes_.end();
}

bool ErrorTaxonomy::Register(std::int32_t code, ErrorKind kind) {
  if (code == 0 || kind == ErrorKind::kUnknown) return false;
  codes_[code] = kind;
  return true;
}

}  // namespace permit::model
