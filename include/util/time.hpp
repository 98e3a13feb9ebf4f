// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace bitwire {
namespace util {

// Current unix time in seconds (mockable)
int64_t GetTime();

// Monotonic clock (advances with mock time while mock time is active)
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time (0 disables mocking)
void SetMockTime(int64_t time);
int64_t GetMockTime();

// RAII helper for tests: enables mock time for the scope, restores the previous value on exit
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace bitwire
