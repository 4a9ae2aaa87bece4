#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace jobq::util {

/*
  UUID helpers

  Job ids are RFC4122 version 4 UUIDs stored in canonical text form
  (8-4-4-4-12, lower case).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string GenerateUUIDString();

std::string ToString(const UUID& id);

// Throws InvalidArgument on malformed input.
UUID FromString(std::string_view str);

bool IsValidUUID(std::string_view str);

} // namespace jobq::util
