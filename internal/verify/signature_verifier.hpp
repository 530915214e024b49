#pragma once

#include <string_view>

namespace gate::verify {

enum class SignatureCheck {
  kValid,
  kInvalid,   // well-formed but does not verify
  kMalformed, // not hex, or not 64 bytes
};

class SignatureVerifier {
 public:
  // message is the payload text exactly as received, never a re-serialization
  SignatureCheck Verify(std::string_view message, std::string_view signature_hex, std::string_view public_key) const;
};

} // namespace gate::verify
