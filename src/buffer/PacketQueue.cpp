// Repository: Aqueduct
// Component: Packet Queue
// Purpose: Bounded per-connection queue of encoded packets with an explicit overload policy.
// Copyright (c) 2025 RetroVue

#include "aqueduct/buffer/PacketQueue.h"

#include <algorithm>
#include <chrono>
#include <utility>

namespace aqueduct::buffer
{

  const char *OverloadPolicyToString(OverloadPolicy policy)
  {
    switch (policy)
    {
    case OverloadPolicy::kBlock:
      return "block";
    case OverloadPolicy::kDropOldest:
      return "drop-oldest";
    default:
      return "unknown";
    }
  }

  PacketQueue::PacketQueue(size_t capacity, OverloadPolicy policy)
      : capacity_(capacity == 0 ? 1 : capacity),
        policy_(policy)
  {
  }

  PushResult PacketQueue::Push(OutboundPacket packet, int64_t timeout_us)
  {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!closed_ && packets_.size() >= capacity_ && policy_ == OverloadPolicy::kDropOldest)
    {
      EvictOldestDroppableLocked();
    }

    auto has_room = [this]
    { return closed_ || packets_.size() < capacity_; };

    if (timeout_us < 0)
    {
      not_full_cv_.wait(lock, has_room);
    }
    else if (!not_full_cv_.wait_for(lock, std::chrono::microseconds(timeout_us), has_room))
    {
      return PushResult::kTimedOut;
    }

    if (closed_)
    {
      return PushResult::kClosed;
    }

    bytes_ += packet.size;
    high_water_bytes_ = std::max(high_water_bytes_, bytes_);
    packets_.push_back(std::move(packet));
    lock.unlock();
    not_empty_cv_.notify_one();
    return PushResult::kQueued;
  }

  bool PacketQueue::Pop(OutboundPacket &packet)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_cv_.wait(lock, [this]
                       { return closed_ || !packets_.empty(); });

    if (packets_.empty())
    {
      return false;
    }

    packet = std::move(packets_.front());
    packets_.pop_front();
    bytes_ -= packet.size;
    const bool now_empty = packets_.empty();
    lock.unlock();

    not_full_cv_.notify_one();
    if (now_empty)
    {
      empty_cv_.notify_all();
    }
    return true;
  }

  void PacketQueue::Close(bool discard)
  {
    std::deque<OutboundPacket> discarded;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      if (discard)
      {
        discarded.swap(packets_);
        bytes_ = 0;
      }
    }
    not_full_cv_.notify_all();
    not_empty_cv_.notify_all();
    empty_cv_.notify_all();
    // Discarded packets drop their buffer references here, outside the lock.
  }

  bool PacketQueue::WaitUntilEmpty(int64_t timeout_us)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    return empty_cv_.wait_for(lock, std::chrono::microseconds(timeout_us),
                              [this]
                              { return packets_.empty(); });
  }

  bool PacketQueue::EvictOldestDroppableLocked()
  {
    auto it = std::find_if(packets_.begin(), packets_.end(),
                           [](const OutboundPacket &p)
                           { return p.IsDroppable(); });
    if (it == packets_.end())
    {
      return false;
    }
    bytes_ -= it->size;
    packets_.erase(it);
    dropped_++;
    return true;
  }

  bool PacketQueue::IsClosed() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t PacketQueue::Size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return packets_.size();
  }

  size_t PacketQueue::Bytes() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_;
  }

  size_t PacketQueue::HighWaterBytes() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return high_water_bytes_;
  }

  uint64_t PacketQueue::Dropped() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

} // namespace aqueduct::buffer
