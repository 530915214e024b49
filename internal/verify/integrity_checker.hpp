#pragma once

#include <string>
#include <string_view>

namespace gate::verify {

enum class Integrity {
  kMatch,
  kMismatch,
};

// SHA-256 of the whole artifact, lowercase hex, compared byte-for-byte
// with the claim. An uppercase claim does not match.
class IntegrityChecker {
 public:
  Integrity Verify(std::string_view artifact, std::string_view claimed_hex) const;

  // lowercase hex SHA-256
  static std::string Digest(std::string_view artifact);
};

} // namespace gate::verify
