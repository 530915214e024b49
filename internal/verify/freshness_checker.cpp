#include "internal/verify/freshness_checker.hpp"

#include <limits>

namespace gate::verify {

FreshnessChecker::FreshnessChecker(std::chrono::seconds max_skew, std::chrono::seconds max_age)
    : max_skew_(max_skew.count()), max_age_(max_age.count()) {
}

Freshness FreshnessChecker::Check(uint64_t claimed_unix_sec, int64_t now_unix_sec) const {
  // anything past int64 is certainly in the future
  if (claimed_unix_sec > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return Freshness::kTooFarFuture;
  }

  const auto claimed = static_cast<int64_t>(claimed_unix_sec);
  if (claimed - now_unix_sec > max_skew_) return Freshness::kTooFarFuture;
  if (now_unix_sec - claimed > max_age_) return Freshness::kTooStale;
  return Freshness::kFresh;
}

const char* ToString(Freshness f) {
  switch (f) {
    case Freshness::kFresh:
      return "fresh";
    case Freshness::kTooFarFuture:
      return "too_far_future";
    case Freshness::kTooStale:
      return "too_stale";
  }
  return "unknown";
}

} // namespace gate::verify
