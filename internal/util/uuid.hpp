#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace medianode::util {

/*
  UUID helpers

  Node ids minted locally are RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace medianode::util
