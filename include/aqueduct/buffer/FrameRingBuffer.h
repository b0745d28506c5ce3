// Repository: Aqueduct
// Component: Frame Ring Buffer
// Purpose: Lock-free circular buffer handing decoded frames from a receiver to a renderer.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_BUFFER_FRAME_RING_BUFFER_H_
#define AQUEDUCT_BUFFER_FRAME_RING_BUFFER_H_

#include <atomic>
#include <cstdint>
#include <memory>

#include "aqueduct/media/MediaFrame.h"

namespace aqueduct::buffer
{

  // FrameRingBuffer is a lock-free circular buffer for producer-consumer frame streaming.
  //
  // Design:
  // - Fixed-size circular buffer (default: 8 frames)
  // - Atomic read/write indices for thread safety
  // - Non-blocking push/pop operations
  // - Frames are moved in and out, so pooled storage changes hands without copying
  //
  // Thread Model:
  // - Single producer (receiver read thread)
  // - Single consumer (renderer thread)
  //
  // Capacity Management:
  // - Buffer is full when: (write_index + 1) % capacity == read_index
  // - Buffer is empty when: write_index == read_index
  class FrameRingBuffer
  {
  public:
    // capacity: Number of slots; one slot stays empty to tell full from empty.
    explicit FrameRingBuffer(size_t capacity = 8);

    ~FrameRingBuffer();

    // Disable copy and move
    FrameRingBuffer(const FrameRingBuffer &) = delete;
    FrameRingBuffer &operator=(const FrameRingBuffer &) = delete;

    // Attempts to push a frame into the buffer.
    // Returns true if successful, false if buffer is full (frame is left untouched).
    // Thread-safe for single producer.
    bool Push(media::MediaFrame &&frame);

    // Attempts to pop a frame from the buffer.
    // Returns true if successful, false if buffer is empty.
    // Thread-safe for single consumer.
    bool Pop(media::MediaFrame &frame);

    // Peeks at the next frame without removing it.
    // Returns nullptr if buffer is empty. Valid until the next Pop().
    const media::MediaFrame *Peek() const;

    // Returns the current number of frames in the buffer.
    // This is an approximate count due to concurrent access.
    size_t Size() const;

    size_t Capacity() const { return capacity_; }

    bool IsEmpty() const;
    bool IsFull() const;

    // Releases all buffered frames back to their pool.
    // Not thread-safe - caller must ensure no concurrent access.
    void Clear();

  private:
    const size_t capacity_;
    std::unique_ptr<media::MediaFrame[]> buffer_;

    std::atomic<uint32_t> write_index_;
    std::atomic<uint32_t> read_index_;
  };

} // namespace aqueduct::buffer

#endif // AQUEDUCT_BUFFER_FRAME_RING_BUFFER_H_
