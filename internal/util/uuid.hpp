#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace siros::util {

/*
  Identifier helpers

  Change records use RFC4122 v4 UUIDs in canonical text form.
  Resources use "siros-" followed by 32 lowercase hex characters.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string GenerateResourceId();

} // namespace siros::util
