#include "ed25519.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace gate::crypto::ed25519 {

namespace {

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
  }
};

struct EvpPkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const {
    EVP_PKEY_CTX_free(ctx);
  }
};

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using PkeyPtr  = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

const unsigned char* Bytes(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

PkeyPtr LoadPublicKey(std::string_view public_key) {
  if (public_key.size() != kPublicKeySize) {
    return nullptr;
  }
  return PkeyPtr(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, Bytes(public_key), public_key.size()));
}

PkeyPtr LoadSeed(std::string_view seed) {
  if (seed.size() != kSeedSize) {
    throw std::invalid_argument("ed25519 seed must be 32 bytes");
  }
  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, Bytes(seed), seed.size()));
  if (!key) throw std::runtime_error("EVP_PKEY_new_raw_private_key failed");
  return key;
}

std::string RawPublicKey(EVP_PKEY* key) {
  std::string out(kPublicKeySize, '\0');
  size_t      len = out.size();
  if (EVP_PKEY_get_raw_public_key(key, reinterpret_cast<unsigned char*>(out.data()), &len) != 1 || len != kPublicKeySize) {
    throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
  }
  return out;
}

} // namespace

bool IsValidPublicKey(std::string_view public_key) {
  return static_cast<bool>(LoadPublicKey(public_key));
}

bool Verify(std::string_view public_key, std::string_view message, std::string_view signature) {
  if (signature.size() != kSignatureSize) {
    return false;
  }

  auto key = LoadPublicKey(public_key);
  if (!key) {
    return false;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

  // Ed25519 takes no digest: the whole message goes through one call.
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), Bytes(signature), signature.size(), Bytes(message), message.size()) == 1;
}

KeyPair GenerateKeyPair() {
  std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    throw std::runtime_error("EVP_PKEY_keygen_init failed");
  }

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    throw std::runtime_error("EVP_PKEY_keygen failed");
  }
  PkeyPtr key(raw);

  KeyPair pair;
  pair.seed.assign(kSeedSize, '\0');
  size_t seed_len = pair.seed.size();
  if (EVP_PKEY_get_raw_private_key(key.get(), reinterpret_cast<unsigned char*>(pair.seed.data()), &seed_len) != 1 || seed_len != kSeedSize) {
    throw std::runtime_error("EVP_PKEY_get_raw_private_key failed");
  }
  pair.public_key = RawPublicKey(key.get());
  return pair;
}

std::string PublicKeyFromSeed(std::string_view seed) {
  auto key = LoadSeed(seed);
  return RawPublicKey(key.get());
}

std::string Sign(std::string_view seed, std::string_view message) {
  auto key = LoadSeed(seed);

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    throw std::runtime_error("EVP_DigestSignInit failed");
  }

  std::string signature(kSignatureSize, '\0');
  size_t      sig_len = signature.size();
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &sig_len, Bytes(message), message.size()) != 1 ||
      sig_len != kSignatureSize) {
    throw std::runtime_error("EVP_DigestSign failed");
  }
  return signature;
}

} // namespace gate::crypto::ed25519
