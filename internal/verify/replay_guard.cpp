#include "internal/verify/replay_guard.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/hex.hpp"

namespace gate::verify {

ReplayGuard::ReplayGuard(std::shared_ptr<cache::ReplayStore> store, std::chrono::seconds ttl)
    : store_(std::move(store)), ttl_(ttl) {
}

std::string ReplayGuard::TokenFor(std::string_view signature_hex) {
  return "nonce:" + util::ToLowerAscii(signature_hex);
}

ClaimResult ReplayGuard::Claim(std::string_view signature_hex) const {
  const auto token = TokenFor(signature_hex);

  try {
    if (!store_->SetIfAbsent(token)) {
      return ClaimResult::kAlreadyClaimed;
    }
  } catch (const std::exception& e) {
    GATE_LOG_ERROR("replay store claim failed", {observability::StringField("error", e.what())});
    return ClaimResult::kStoreUnavailable;
  }

  try {
    store_->Expire(token, ttl_);
  } catch (const std::exception& e) {
    GATE_LOG_WARN("replay token expiry not set", {observability::StringField("token", token),
                  observability::StringField("error", e.what())});
  }

  return ClaimResult::kClaimed;
}

const char* ToString(ClaimResult r) {
  switch (r) {
    case ClaimResult::kClaimed:
      return "claimed";
    case ClaimResult::kAlreadyClaimed:
      return "already_claimed";
    case ClaimResult::kStoreUnavailable:
      return "store_unavailable";
  }
  return "unknown";
}

} // namespace gate::verify
