#pragma once

#include <chrono>
#include <cstdint>

namespace gate::verify {

enum class Freshness {
  kFresh,
  kTooFarFuture,
  kTooStale,
};

/*
  Fresh iff  claimed <= now + max_skew  and  now - claimed <= max_age.
  Boundaries are inclusive. All arithmetic is signed, so a claim ahead of
  the local clock never underflows into "stale".
*/
class FreshnessChecker {
 public:
  FreshnessChecker(std::chrono::seconds max_skew, std::chrono::seconds max_age);

  Freshness Check(uint64_t claimed_unix_sec, int64_t now_unix_sec) const;

 private:
  int64_t max_skew_;
  int64_t max_age_;
};

const char* ToString(Freshness f);

} // namespace gate::verify
