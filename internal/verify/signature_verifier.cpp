#include "internal/verify/signature_verifier.hpp"

#include "internal/crypto/ed25519.hpp"
#include "internal/util/hex.hpp"

namespace gate::verify {

SignatureCheck SignatureVerifier::Verify(std::string_view message, std::string_view signature_hex,
                                         std::string_view public_key) const {
  auto signature = util::HexDecode(signature_hex);
  if (!signature || signature->size() != crypto::ed25519::kSignatureSize) {
    return SignatureCheck::kMalformed;
  }

  return crypto::ed25519::Verify(public_key, message, *signature) ? SignatureCheck::kValid : SignatureCheck::kInvalid;
}

} // namespace gate::verify
