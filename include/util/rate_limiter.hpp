// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license
// Rate limiter for logging

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace bitwire {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Each callsite gets N tokens that refill over a period. A peer that
 * sends a stream of bad frames can only produce a bounded number of
 * log lines per callsite.
 */
class RateLimiter {
public:
  // Returns true if the message should be logged, false if rate-limited.
  // callsite_key identifies the log callsite (file:line), tokens_per_period is the
  // burst capacity and period_seconds the time to refill it completely.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  static RateLimiter& instance();

private:
  // Starts full; refilled lazily on each query
  struct TokenBucket {
    double tokens;
    std::chrono::steady_clock::time_point last_refill;
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace bitwire
