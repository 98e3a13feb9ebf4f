// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace bitwire {
namespace util {

namespace {

// Mock state. mock_seconds == 0 means the real clocks are used.
struct MockClock {
  std::atomic<int64_t> mock_seconds{0};

  // Steady anchor: the real steady time at which the first mocked value was seen
  std::mutex anchor_mutex;
  bool anchored{false};
  int64_t anchor_seconds{0};
  std::chrono::steady_clock::time_point anchor_steady;
};

MockClock& Clock() {
  static MockClock clock;
  return clock;
}

}  // namespace

int64_t GetTime() {
  if (int64_t mocked = Clock().mock_seconds.load(std::memory_order_relaxed)) {
    return mocked;
  }
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  MockClock& clock = Clock();
  const int64_t mocked = clock.mock_seconds.load(std::memory_order_relaxed);
  if (mocked == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(clock.anchor_mutex);
  if (!clock.anchored) {
    clock.anchor_steady = std::chrono::steady_clock::now();
    clock.anchor_seconds = mocked;
    clock.anchored = true;
  }
  // Mock time moves the steady clock by the same amount, never backwards past the anchor
  return clock.anchor_steady + std::chrono::seconds(mocked - clock.anchor_seconds);
}

void SetMockTime(int64_t time) {
  MockClock& clock = Clock();
  clock.mock_seconds.store(time, std::memory_order_relaxed);
  if (time == 0) {
    std::lock_guard<std::mutex> lock(clock.anchor_mutex);
    clock.anchored = false;
  }
}

int64_t GetMockTime() {
  return Clock().mock_seconds.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace bitwire
