#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace release::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 version 4 UUIDs, used for release and deployment ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Lowercase hex of the first n bytes, no dashes.
std::string ShortHex(const UUID& id, std::size_t bytes);

} // namespace release::util
