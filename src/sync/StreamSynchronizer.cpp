// Repository: Aqueduct
// Component: Stream Synchronizer
// Purpose: Per-channel timestamp stamping (sender) and advisory validation (receiver).
// Copyright (c) 2025 RetroVue

#include "aqueduct/sync/StreamSynchronizer.h"

#include <utility>

namespace aqueduct::sync {

// ============================================================================
// SenderClock
// ============================================================================

SenderClock::SenderClock(std::shared_ptr<timing::MasterClock> clock)
    : clock_(std::move(clock)),
      epoch_monotonic_us_(clock_ ? clock_->now_monotonic_us() : 0) {}

uint64_t SenderClock::Stamp(wire::PacketType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t elapsed = clock_ ? clock_->now_monotonic_us() - epoch_monotonic_us_ : 0;
  uint64_t stamp = elapsed > 0 ? static_cast<uint64_t>(elapsed) : 0;

  ChannelClock& channel = channels_[wire::ChannelIndex(type)];
  if (channel.has_value && stamp <= channel.last_us) {
    stamp = channel.last_us + 1;
  }
  channel.last_us = stamp;
  channel.has_value = true;
  return stamp;
}

void SenderClock::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  epoch_monotonic_us_ = clock_ ? clock_->now_monotonic_us() : 0;
  channels_ = {};
}

ChannelClock SenderClock::channel(wire::PacketType type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_[wire::ChannelIndex(type)];
}

// ============================================================================
// ReceiverSynchronizer
// ============================================================================

const char* SyncVerdictToString(SyncVerdict verdict) {
  switch (verdict) {
    case SyncVerdict::kInOrder:
      return "in_order";
    case SyncVerdict::kNonMonotonic:
      return "non_monotonic";
    case SyncVerdict::kExcessiveSkew:
      return "excessive_skew";
    default:
      return "unknown";
  }
}

ReceiverSynchronizer::ReceiverSynchronizer(uint64_t max_skew_us)
    : max_skew_us_(max_skew_us) {}

SyncVerdict ReceiverSynchronizer::Observe(wire::PacketType type, uint64_t timestamp_us) {
  const size_t index = wire::ChannelIndex(type);
  ChannelClock& channel = channels_[index];

  SyncVerdict verdict = SyncVerdict::kInOrder;
  if (channel.has_value && timestamp_us < channel.last_us) {
    verdict = SyncVerdict::kNonMonotonic;
  } else if (max_skew_us_ > 0) {
    // Compare against the newest timestamp seen on any other channel.
    bool have_reference = false;
    uint64_t newest_other = 0;
    for (size_t i = 0; i < channels_.size(); ++i) {
      if (i == index || !channels_[i].has_value) {
        continue;
      }
      if (!have_reference || channels_[i].last_us > newest_other) {
        newest_other = channels_[i].last_us;
        have_reference = true;
      }
    }
    if (have_reference) {
      const uint64_t distance = timestamp_us > newest_other ? timestamp_us - newest_other
                                                            : newest_other - timestamp_us;
      if (distance > max_skew_us_) {
        verdict = SyncVerdict::kExcessiveSkew;
      }
    }
  }

  // last_us follows the observed value, anomalous or not.
  channel.last_us = timestamp_us;
  channel.has_value = true;

  if (verdict != SyncVerdict::kInOrder) {
    anomalies_++;
  }
  return verdict;
}

ChannelClock ReceiverSynchronizer::channel(wire::PacketType type) const {
  return channels_[wire::ChannelIndex(type)];
}

void ReceiverSynchronizer::Reset() {
  channels_ = {};
  anomalies_ = 0;
}

}  // namespace aqueduct::sync
