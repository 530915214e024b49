#include "internal/verify/integrity_checker.hpp"

#include "internal/crypto/digest.hpp"

namespace gate::verify {

Integrity IntegrityChecker::Verify(std::string_view artifact, std::string_view claimed_hex) const {
  return Digest(artifact) == claimed_hex ? Integrity::kMatch : Integrity::kMismatch;
}

std::string IntegrityChecker::Digest(std::string_view artifact) {
  return crypto::Sha256Hex(artifact);
}

} // namespace gate::verify
