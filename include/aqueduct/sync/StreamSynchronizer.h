// Repository: Aqueduct
// Component: Stream Synchronizer
// Purpose: Per-channel timestamp stamping (sender) and advisory validation (receiver).
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_SYNC_STREAM_SYNCHRONIZER_H_
#define AQUEDUCT_SYNC_STREAM_SYNCHRONIZER_H_

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>

#include "aqueduct/timing/MasterClock.h"
#include "aqueduct/wire/PacketHeader.h"

namespace aqueduct::sync {

// ChannelClock is the last timestamp emitted (sender) or observed (receiver)
// on one channel.
struct ChannelClock {
  uint64_t last_us = 0;
  bool has_value = false;
};

// SenderClock stamps outgoing frames.
//
// All channels share one epoch taken from the MasterClock's monotonic time
// when the clock is created (or Reset()), so a receiver can line up
// video, audio and metadata by timestamp alone. Within a channel stamps are
// strictly increasing even if the master clock has not advanced.
//
// Thread-safe.
class SenderClock {
 public:
  explicit SenderClock(std::shared_ptr<timing::MasterClock> clock);

  // Returns microseconds since session start for the next frame on `type`.
  uint64_t Stamp(wire::PacketType type);

  // Starts a new session epoch and forgets per-channel history.
  void Reset();

  ChannelClock channel(wire::PacketType type) const;

 private:
  std::shared_ptr<timing::MasterClock> clock_;
  mutable std::mutex mutex_;
  int64_t epoch_monotonic_us_;
  std::array<ChannelClock, wire::kChannelCount> channels_;
};

enum class SyncVerdict {
  kInOrder = 0,
  kNonMonotonic,    // Earlier than the last timestamp seen on this channel
  kExcessiveSkew,   // Further than max_skew_us from the newest other channel
};

const char* SyncVerdictToString(SyncVerdict verdict);

// ReceiverSynchronizer validates incoming timestamps, one instance per
// connection. It only reports; it never rejects, reorders or holds back a
// packet. Equal consecutive timestamps are in order.
//
// Not thread-safe: owned by the connection's read thread.
class ReceiverSynchronizer {
 public:
  // max_skew_us == 0 disables the cross-channel skew check.
  explicit ReceiverSynchronizer(uint64_t max_skew_us = 0);

  SyncVerdict Observe(wire::PacketType type, uint64_t timestamp_us);

  ChannelClock channel(wire::PacketType type) const;
  uint64_t anomalies() const { return anomalies_; }

  void Reset();

 private:
  uint64_t max_skew_us_;
  std::array<ChannelClock, wire::kChannelCount> channels_;
  uint64_t anomalies_ = 0;
};

}  // namespace aqueduct::sync

#endif  // AQUEDUCT_SYNC_STREAM_SYNCHRONIZER_H_
