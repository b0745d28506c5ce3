#include "timing/TestMasterClock.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace aqueduct::timing {

TestMasterClock::TestMasterClock(Mode mode)
    : mode_(mode),
      utc_us_(0),
      monotonic_us_(0),
      max_wait_us_(0) {}

TestMasterClock::TestMasterClock(int64_t start_time_us, Mode mode)
    : mode_(mode),
      utc_us_(start_time_us),
      monotonic_us_(start_time_us),
      max_wait_us_(0) {}

int64_t TestMasterClock::now_utc_us() const {
  return utc_us_.load(std::memory_order_acquire);
}

int64_t TestMasterClock::now_monotonic_us() const {
  return monotonic_us_.load(std::memory_order_acquire);
}

bool TestMasterClock::is_fake() const {
  return mode_ == Mode::Deterministic;
}

void TestMasterClock::WaitUntilUtcUs(int64_t target_utc_us) const {
  if (mode_ == Mode::Deterministic) {
    std::unique_lock<std::mutex> lock(mutex_);
    const int64_t max_wait_us = max_wait_us_.load(std::memory_order_acquire);
    auto reached = [&] {
      return utc_us_.load(std::memory_order_acquire) >= target_utc_us;
    };
    if (max_wait_us > 0) {
      cv_.wait_for(lock, std::chrono::microseconds(max_wait_us), reached);
    } else {
      cv_.wait(lock, reached);
    }
    return;
  }

  // RealTime mode: poll, since another thread advances the clock.
  while (true) {
    const int64_t remaining = target_utc_us - now_utc_us();
    if (remaining <= 0) {
      break;
    }
    std::this_thread::sleep_for(
        std::chrono::microseconds(std::min<int64_t>(std::max<int64_t>(remaining / 2, 200), 2'000)));
  }
}

void TestMasterClock::SetNow(int64_t utc_us, int64_t monotonic_us) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    utc_us_.store(utc_us, std::memory_order_release);
    monotonic_us_.store(monotonic_us, std::memory_order_release);
  }
  cv_.notify_all();
}

void TestMasterClock::AdvanceMicroseconds(int64_t delta_us) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    utc_us_.fetch_add(delta_us, std::memory_order_acq_rel);
    monotonic_us_.fetch_add(delta_us, std::memory_order_acq_rel);
  }
  cv_.notify_all();
}

void TestMasterClock::SetMaxWaitUs(int64_t max_wait_us) {
  max_wait_us_.store(max_wait_us, std::memory_order_release);
}

}  // namespace aqueduct::timing
