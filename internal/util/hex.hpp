#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gate::util {

// Lowercase hex, two characters per byte.
std::string HexEncode(std::string_view bytes);
std::string HexEncode(const uint8_t* data, std::size_t size);

// Accepts upper and lower case digits. nullopt on odd length or a non-hex character.
std::optional<std::string> HexDecode(std::string_view hex);

std::string ToLowerAscii(std::string_view text);

} // namespace gate::util
