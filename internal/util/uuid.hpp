#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace upload::util {

/*
  UUID helpers

  Session and asset ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Canonical lowercase string of a fresh v4 UUID.
std::string NewId();

bool IsValidId(const std::string& str);

} // namespace upload::util
