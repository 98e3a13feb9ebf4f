// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace bitwire {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  if (tokens_per_period <= 0 || period_seconds <= 0) {
    return false;
  }
  const double capacity = static_cast<double>(tokens_per_period);
  const auto now = GetSteadyTime();

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(callsite_key, TokenBucket{capacity, now});
  TokenBucket& bucket = it->second;

  if (!inserted && now > bucket.last_refill) {
    const double elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
    bucket.tokens = std::min(capacity, bucket.tokens + elapsed * capacity / period_seconds);
    bucket.last_refill = now;
  }

  if (bucket.tokens < 1.0) {
    return false;
  }
  bucket.tokens -= 1.0;
  return true;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace bitwire
