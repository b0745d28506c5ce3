// Repository: Aqueduct
// Component: Frame Ring Buffer
// Purpose: Lock-free circular buffer handing decoded frames from a receiver to a renderer.
// Copyright (c) 2025 RetroVue

#include "aqueduct/buffer/FrameRingBuffer.h"

#include <utility>

namespace aqueduct::buffer
{

  FrameRingBuffer::FrameRingBuffer(size_t capacity)
      : capacity_(capacity < 2 ? 2 : capacity),
        buffer_(new media::MediaFrame[capacity < 2 ? 2 : capacity]),
        write_index_(0),
        read_index_(0)
  {
  }

  FrameRingBuffer::~FrameRingBuffer() = default;

  bool FrameRingBuffer::Push(media::MediaFrame &&frame)
  {
    const uint32_t current_write = write_index_.load(std::memory_order_relaxed);
    const uint32_t next_write = static_cast<uint32_t>((current_write + 1) % capacity_);

    if (next_write == read_index_.load(std::memory_order_acquire))
    {
      return false;
    }

    buffer_[current_write] = std::move(frame);
    write_index_.store(next_write, std::memory_order_release);
    return true;
  }

  bool FrameRingBuffer::Pop(media::MediaFrame &frame)
  {
    const uint32_t current_read = read_index_.load(std::memory_order_relaxed);

    if (current_read == write_index_.load(std::memory_order_acquire))
    {
      return false;
    }

    frame = std::move(buffer_[current_read]);
    read_index_.store(static_cast<uint32_t>((current_read + 1) % capacity_),
                      std::memory_order_release);
    return true;
  }

  const media::MediaFrame *FrameRingBuffer::Peek() const
  {
    const uint32_t current_read = read_index_.load(std::memory_order_relaxed);
    if (current_read == write_index_.load(std::memory_order_acquire))
    {
      return nullptr;
    }
    return &buffer_[current_read];
  }

  size_t FrameRingBuffer::Size() const
  {
    const uint32_t write = write_index_.load(std::memory_order_acquire);
    const uint32_t read = read_index_.load(std::memory_order_acquire);
    if (write >= read)
    {
      return write - read;
    }
    return capacity_ - read + write;
  }

  bool FrameRingBuffer::IsEmpty() const
  {
    return read_index_.load(std::memory_order_acquire) ==
           write_index_.load(std::memory_order_acquire);
  }

  bool FrameRingBuffer::IsFull() const
  {
    const uint32_t next_write =
        static_cast<uint32_t>((write_index_.load(std::memory_order_acquire) + 1) % capacity_);
    return next_write == read_index_.load(std::memory_order_acquire);
  }

  void FrameRingBuffer::Clear()
  {
    for (size_t i = 0; i < capacity_; ++i)
    {
      buffer_[i] = media::MediaFrame();
    }
    write_index_.store(0, std::memory_order_release);
    read_index_.store(0, std::memory_order_release);
  }

} // namespace aqueduct::buffer
