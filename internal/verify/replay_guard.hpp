#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "internal/cache/replay_store.hpp"

namespace gate::verify {

/*
  First-use claim on a submission signature.

  The claim is keyed on the signature, never on the payload nonce.
  Set-if-absent and expire are two separate store calls: a failing expire
  after a successful claim only logs, the claim stands.
*/

enum class ClaimResult {
  kClaimed,
  kAlreadyClaimed,
  kStoreUnavailable,
};

class ReplayGuard {
 public:
  ReplayGuard(std::shared_ptr<cache::ReplayStore> store, std::chrono::seconds ttl);

  ClaimResult Claim(std::string_view signature_hex) const;

  // "nonce:" + lowercase signature hex
  static std::string TokenFor(std::string_view signature_hex);

 private:
  std::shared_ptr<cache::ReplayStore> store_;
  std::chrono::seconds                ttl_;
};

const char* ToString(ClaimResult r);

} // namespace gate::verify
