#include "internal/model/status.hpp"

#include <charconv>
#include <system_error>

namespace permit::model {

std::string_view ToString(ProcessingStatus status) {
  switch (status) {
    case ProcessingStatus::kSuccess:
      return "success";
    case ProcessingStatus::kError:
      return "error";
    case ProcessingStatus::kNotProcessed:
      break;
  }
  return "not_processed";
}

DecodedStatus Decode(std::optional<std::int32_t> status_code, const ErrorTaxonomy& taxonomy) noexcept {
  if (!status_code.has_value()) {
    return {ProcessingStatus::kNotProcessed, std::nullopt};
  }
  if (*status_code == 0) {
    return {ProcessingStatus::kSuccess, std::nullopt};
  }
  return {ProcessingStatus::kError, ErrorCode{taxonomy.Lookup(*status_code), *status_code}};
}

std::string Describe(const DecodedStatus& decoded) {
  std::string out(ToString(decoded.status));
  if (decoded.error) {
    out += "(";
    out += ToString(decoded.error->kind);
    out += "/";
    out += std::to_string(decoded.error->raw_code);
    out += ")";
  }
  return out;
}

std::optional<std::int32_t> ParseStatusCode(std::string_view text) noexcept {
  std::int32_t value = 0;
  const auto* end    = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace permit::model
