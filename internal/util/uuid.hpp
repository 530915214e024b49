#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace gate::util {

/*
  UUID helpers

  Ledger record ids are RFC4122 version 4 UUIDs (122 random bits)
  rendered in the canonical 8-4-4-4-12 form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace gate::util
