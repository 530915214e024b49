#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gate::crypto::ed25519 {

/*
  Pure Ed25519 (RFC 8032) over OpenSSL EVP.

  Keys and signatures travel as raw byte strings:
    public key   32 bytes
    secret seed  32 bytes (the form PyNaCl's SigningKey is hex-encoded in)
    signature    64 bytes
*/

constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSeedSize      = 32;
constexpr std::size_t kSignatureSize = 64;

struct KeyPair {
  std::string seed;
  std::string public_key;
};

// True when `public_key` has the right length and OpenSSL accepts it as a key.
bool IsValidPublicKey(std::string_view public_key);

// Returns false for a bad signature as well as for a key OpenSSL rejects.
bool Verify(std::string_view public_key, std::string_view message, std::string_view signature);

KeyPair     GenerateKeyPair();
std::string PublicKeyFromSeed(std::string_view seed);
std::string Sign(std::string_view seed, std::string_view message);

} // namespace gate::crypto::ed25519
