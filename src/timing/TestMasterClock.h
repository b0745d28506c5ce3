#ifndef AQUEDUCT_TIMING_TEST_MASTER_CLOCK_H_
#define AQUEDUCT_TIMING_TEST_MASTER_CLOCK_H_

#include "aqueduct/timing/MasterClock.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace aqueduct::timing {

// TestMasterClock supports two modes:
// - RealTime: Uses sleep-based waiting (for tests that need real time progression)
// - Deterministic: Uses condition variable-based waiting (for fully deterministic tests)
//
// In both modes time only moves when the test advances it.
class TestMasterClock : public MasterClock {
 public:
  enum class Mode {
    RealTime,
    Deterministic
  };

  explicit TestMasterClock(Mode mode = Mode::RealTime);

  // Construct with an initial time (utc and monotonic both start there).
  explicit TestMasterClock(int64_t start_time_us, Mode mode = Mode::Deterministic);

  int64_t now_utc_us() const override;
  int64_t now_monotonic_us() const override;
  bool is_fake() const override;
  void WaitUntilUtcUs(int64_t target_utc_us) const override;

  // Time control methods
  void SetNow(int64_t utc_us, int64_t monotonic_us);
  void AdvanceMicroseconds(int64_t delta_us);
  void advance_us(int64_t delta_us) { AdvanceMicroseconds(delta_us); }

  // Bounds WaitUntilUtcUs in deterministic mode (0 = wait until advanced).
  void SetMaxWaitUs(int64_t max_wait_us);

 private:
  Mode mode_;
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<int64_t> utc_us_;
  std::atomic<int64_t> monotonic_us_;
  std::atomic<int64_t> max_wait_us_;
};

}  // namespace aqueduct::timing

#endif  // AQUEDUCT_TIMING_TEST_MASTER_CLOCK_H_
