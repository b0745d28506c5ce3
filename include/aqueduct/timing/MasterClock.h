#ifndef AQUEDUCT_TIMING_MASTER_CLOCK_H_
#define AQUEDUCT_TIMING_MASTER_CLOCK_H_

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace aqueduct::timing {

// MasterClock provides the wall-clock and monotonic time every session
// timestamp is derived from.
class MasterClock {
 public:
  virtual ~MasterClock() = default;

  // Returns current UTC time in microseconds since Unix epoch.
  virtual int64_t now_utc_us() const = 0;

  // Returns monotonic time in microseconds relative to clock start.
  // Never goes backwards.
  virtual int64_t now_monotonic_us() const = 0;

  // Returns true if this is a fake/test clock (for testing only).
  // Fake clocks should not trigger real-time sleeps in consumers.
  virtual bool is_fake() const { return false; }

  // Blocks until the clock reaches or exceeds target_utc_us.
  // For real clocks, this uses sleep-based waiting.
  // For fake clocks, this blocks on a condition variable woken by time advances.
  virtual void WaitUntilUtcUs(int64_t target_utc_us) const {
    while (true) {
      const int64_t now = now_utc_us();
      const int64_t remaining = target_utc_us - now;
      if (remaining <= 0) {
        break;
      }
      const int64_t sleep_us = (remaining > 2'000) ? remaining - 1'000
                                                    : std::max<int64_t>(remaining / 2, 200);
      std::this_thread::sleep_for(std::chrono::microseconds(sleep_us));
    }
  }
};

std::shared_ptr<MasterClock> MakeSystemMasterClock();

}  // namespace aqueduct::timing

#endif  // AQUEDUCT_TIMING_MASTER_CLOCK_H_
