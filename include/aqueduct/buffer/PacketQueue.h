// Repository: Aqueduct
// Component: Packet Queue
// Purpose: Bounded per-connection queue of encoded packets with an explicit overload policy.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_BUFFER_PACKET_QUEUE_H_
#define AQUEDUCT_BUFFER_PACKET_QUEUE_H_

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/wire/PacketHeader.h"

namespace aqueduct::buffer
{

  // What Push() does when the queue is full.
  enum class OverloadPolicy
  {
    kBlock,      // Wait for space (default)
    kDropOldest, // Evict the oldest non-key video/audio packet, else wait
  };

  const char *OverloadPolicyToString(OverloadPolicy policy);

  // OutboundPacket references one framed packet (header included) inside a
  // shared buffer. Several connection queues may hold the same buffer.
  struct OutboundPacket
  {
    SharedBuffer buffer;
    size_t offset = 0; // First header byte within buffer
    size_t size = 0;   // Header plus payload bytes
    wire::PacketType type = wire::PacketType::kControl;
    uint32_t flags = 0;

    const uint8_t *data() const { return buffer ? buffer->data() + offset : nullptr; }

    // Key frames, metadata and control are never dropped.
    bool IsDroppable() const
    {
      return (type == wire::PacketType::kVideo || type == wire::PacketType::kAudio) &&
             (flags & wire::flags::kKeyFrame) == 0;
    }
  };

  enum class PushResult
  {
    kQueued,
    kTimedOut,
    kClosed,
  };

  // PacketQueue bounds the packets pending for one connection.
  //
  // Backpressure:
  // - At most `capacity` packets are held. A full queue blocks Push(), which
  //   suspends the producer instead of growing memory.
  // - Under kDropOldest the oldest droppable packet is evicted to make room.
  //   If none is droppable Push() blocks as under kBlock.
  //
  // Thread Model:
  // - Any number of producers, one consumer (the connection writer).
  class PacketQueue
  {
  public:
    explicit PacketQueue(size_t capacity, OverloadPolicy policy = OverloadPolicy::kBlock);

    PacketQueue(const PacketQueue &) = delete;
    PacketQueue &operator=(const PacketQueue &) = delete;

    // Enqueues `packet`. timeout_us < 0 waits indefinitely.
    // Returns kClosed once Close() has been called.
    PushResult Push(OutboundPacket packet, int64_t timeout_us = -1);

    // Dequeues the oldest packet, waiting until one is available.
    // Returns false when the queue is closed and nothing is left to deliver.
    bool Pop(OutboundPacket &packet);

    // Stops the queue and wakes all waiters. With `discard`, pending packets
    // are released immediately; otherwise Pop() drains them first.
    void Close(bool discard);

    // Waits until the queue is empty or `timeout_us` elapses.
    // Returns true if empty.
    bool WaitUntilEmpty(int64_t timeout_us);

    bool IsClosed() const;
    size_t Size() const;
    size_t Bytes() const;
    size_t HighWaterBytes() const;
    uint64_t Dropped() const;
    size_t Capacity() const { return capacity_; }
    OverloadPolicy Policy() const { return policy_; }

  private:
    // Removes the oldest droppable packet. Caller holds mutex_.
    bool EvictOldestDroppableLocked();

    const size_t capacity_;
    const OverloadPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_cv_;
    std::condition_variable not_empty_cv_;
    std::condition_variable empty_cv_;
    std::deque<OutboundPacket> packets_;
    size_t bytes_ = 0;
    size_t high_water_bytes_ = 0;
    uint64_t dropped_ = 0;
    bool closed_ = false;
  };

} // namespace aqueduct::buffer

#endif // AQUEDUCT_BUFFER_PACKET_QUEUE_H_
