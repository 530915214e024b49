#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace gate::crypto {

constexpr std::size_t kSha256Size = 32;

using Sha256Digest = std::array<uint8_t, kSha256Size>;

// Hashes every byte of `data`.
Sha256Digest Sha256(std::string_view data);

// Lowercase hex of Sha256(data).
std::string Sha256Hex(std::string_view data);

} // namespace gate::crypto
