#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace permit::util {

/*
  UUID helpers

  Request ids are random RFC4122 v4 UUIDs, stored and transmitted in
  canonical 8-4-4-4-12 lowercase text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// GenerateUUID() rendered as text.
std::string NewId();

bool IsCanonical(const std::string& str);

} // namespace permit::util
