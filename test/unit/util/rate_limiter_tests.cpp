// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/rate_limiter.hpp"
#include "util/time.hpp"

using namespace bitwire::util;

TEST_CASE("RateLimiter allows a burst then blocks", "[rate_limiter]") {
  MockTimeScope mock(1700000000);
  RateLimiter limiter;

  for (int i = 0; i < 3; ++i) {
    CHECK(limiter.should_log("peer.cpp:10", 3, 60));
  }
  CHECK_FALSE(limiter.should_log("peer.cpp:10", 3, 60));
}

TEST_CASE("RateLimiter buckets are independent per callsite", "[rate_limiter]") {
  MockTimeScope mock(1700000000);
  RateLimiter limiter;

  CHECK(limiter.should_log("a", 1, 60));
  CHECK_FALSE(limiter.should_log("a", 1, 60));
  CHECK(limiter.should_log("b", 1, 60));
}

TEST_CASE("RateLimiter refills over time", "[rate_limiter]") {
  MockTimeScope mock(1700000000);
  RateLimiter limiter;

  CHECK(limiter.should_log("site", 2, 10));
  CHECK(limiter.should_log("site", 2, 10));
  CHECK_FALSE(limiter.should_log("site", 2, 10));

  // 2 tokens per 10 seconds: 5 seconds buys one token
  SetMockTime(1700000005);
  CHECK(limiter.should_log("site", 2, 10));
  CHECK_FALSE(limiter.should_log("site", 2, 10));

  // Refill is capped at the burst size
  SetMockTime(1700001000);
  CHECK(limiter.should_log("site", 2, 10));
  CHECK(limiter.should_log("site", 2, 10));
  CHECK_FALSE(limiter.should_log("site", 2, 10));
}

TEST_CASE("RateLimiter rejects non-positive parameters", "[rate_limiter]") {
  RateLimiter limiter;
  CHECK_FALSE(limiter.should_log("x", 0, 60));
  CHECK_FALSE(limiter.should_log("x", 5, 0));
}
