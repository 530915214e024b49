#include "internal/verify/freshness_checker.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>

namespace {

using gate::verify::Freshness;
using gate::verify::FreshnessChecker;

constexpr int64_t kNow = 1'700'000'000;

FreshnessChecker DefaultChecker() {
  return FreshnessChecker(std::chrono::seconds(60), std::chrono::seconds(300));
}

void TestBoundariesAreInclusive() {
  const auto checker = DefaultChecker();
  assert(checker.Check(kNow, kNow) == Freshness::kFresh);
  assert(checker.Check(kNow + 60, kNow) == Freshness::kFresh);
  assert(checker.Check(kNow - 300, kNow) == Freshness::kFresh);
}

void TestOutsideWindow() {
  const auto checker = DefaultChecker();
  assert(checker.Check(kNow + 61, kNow) == Freshness::kTooFarFuture);
  assert(checker.Check(kNow - 301, kNow) == Freshness::kTooStale);
  assert(checker.Check(0, kNow) == Freshness::kTooStale);
}

void TestClaimAheadOfClockNeverLooksStale() {
  const auto checker = DefaultChecker();
  assert(checker.Check(kNow + 30, kNow) == Freshness::kFresh);
  assert(checker.Check(std::numeric_limits<uint64_t>::max(), kNow) == Freshness::kTooFarFuture);
  assert(checker.Check(static_cast<uint64_t>(std::numeric_limits<int64_t>::max()), kNow) == Freshness::kTooFarFuture);
}

void TestCustomWindow() {
  FreshnessChecker checker(std::chrono::seconds(0), std::chrono::seconds(5));
  assert(checker.Check(kNow + 1, kNow) == Freshness::kTooFarFuture);
  assert(checker.Check(kNow - 5, kNow) == Freshness::kFresh);
  assert(checker.Check(kNow - 6, kNow) == Freshness::kTooStale);
}

} // namespace

int main() {
  TestBoundariesAreInclusive();
  TestOutsideWindow();
  TestClaimAheadOfClockNeverLooksStale();
  TestCustomWindow();

  std::cout << "submission_gate_unit_freshness_checker: pass\n";
  return 0;
}
