#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/error_taxonomy.hpp"

namespace permit::model {

enum class ProcessingStatus : std::uint8_t {
  kNotProcessed = 0,
  kSuccess = 1,
  kError = 2,
};

std::string_view ToString(ProcessingStatus status);

// Typed view of a non-zero statusCode. raw_code is kept verbatim, which is
// what makes kUnknown diagnosable.
struct ErrorCode {
  ErrorKind    kind = ErrorKind::kUnknown;
  std::int32_t raw_code = 0;

  bool IsKnown() const {
    return kind != ErrorKind::kUnknown;
  }

  bool operator==(const ErrorCode&) const = default;
};

struct DecodedStatus {
  ProcessingStatus         status = ProcessingStatus::kNotProcessed;
  std::optional<ErrorCode> error;

  bool operator==(const DecodedStatus&) const = default;
};

/*
  decode(statusCode):
    absent -> NotProcessed
    0      -> Success
    other  -> Error + taxonomy lookup

  Pure and total; never throws for an unrecognized code.
*/
DecodedStatus Decode(std::optional<std::int32_t> status_code, const ErrorTaxonomy& taxonomy) noexcept;

inline DecodedStatus Decode(std::optional<std::int32_t> status_code) noexcept {
  return Decode(status_code, ErrorTaxonomy::Builtin());
}

// "error(access_denied/614)" style rendering for logs and the CLI.
std::string Describe(const DecodedStatus& decoded);

// Decimal statusCode as typed by an operator. The whole text must be a
// number that fits int32; "614abc", " 614" and "" are rejected.
std::optional<std::int32_t> ParseStatusCode(std::string_view text) noexcept;

}  // namespace permit::model
