// Repository: Aqueduct
// Component: Buffer Pool
// Purpose: Power-of-two bucketed pool of reusable byte blocks with scoped release.
// Copyright (c) 2025 RetroVue

#include "aqueduct/buffer/BufferPool.h"

#include <iostream>
#include <limits>
#include <utility>

namespace aqueduct::buffer
{

  // ============================================================================
  // PooledBuffer
  // ============================================================================

  PooledBuffer::PooledBuffer(std::shared_ptr<BufferPool> pool,
                             std::unique_ptr<uint8_t[]> block,
                             size_t capacity)
      : pool_(std::move(pool)),
        block_(std::move(block)),
        capacity_(capacity),
        size_(0)
  {
  }

  PooledBuffer::~PooledBuffer()
  {
    Reset();
  }

  PooledBuffer::PooledBuffer(PooledBuffer &&other) noexcept
      : pool_(std::move(other.pool_)),
        block_(std::move(other.block_)),
        capacity_(other.capacity_),
        size_(other.size_)
  {
    other.capacity_ = 0;
    other.size_ = 0;
  }

  PooledBuffer &PooledBuffer::operator=(PooledBuffer &&other) noexcept
  {
    if (this != &other)
    {
      Reset();
      pool_ = std::move(other.pool_);
      block_ = std::move(other.block_);
      capacity_ = other.capacity_;
      size_ = other.size_;
      other.capacity_ = 0;
      other.size_ = 0;
    }
    return *this;
  }

  bool PooledBuffer::set_size(size_t size)
  {
    if (size > capacity_)
    {
      return false;
    }
    size_ = size;
    return true;
  }

  void PooledBuffer::Reset()
  {
    if (block_ && pool_)
    {
      pool_->Release(std::move(block_), capacity_);
    }
    block_.reset();
    pool_.reset();
    capacity_ = 0;
    size_ = 0;
  }

  // ============================================================================
  // BufferPool
  // ============================================================================

  std::shared_ptr<BufferPool> BufferPool::Create(const BufferPoolConfig &config)
  {
    if (config.max_buffer_bytes == 0 ||
        config.max_buffer_bytes > (std::numeric_limits<size_t>::max() >> 1))
    {
      std::cerr << "[BufferPool] Invalid config: max_buffer_bytes out of range ("
                << config.max_buffer_bytes << ")" << std::endl;
      return nullptr;
    }
    if (config.max_outstanding_bytes != 0 &&
        config.max_outstanding_bytes < CapacityClassFor(config.max_buffer_bytes))
    {
      std::cerr << "[BufferPool] Invalid config: max_outstanding_bytes ("
                << config.max_outstanding_bytes
                << ") cannot hold one max-sized buffer ("
                << CapacityClassFor(config.max_buffer_bytes) << ")" << std::endl;
      return nullptr;
    }
    return std::shared_ptr<BufferPool>(new BufferPool(config));
  }

  BufferPool::BufferPool(const BufferPoolConfig &config) : config_(config) {}

  BufferPool::~BufferPool() = default;

  size_t BufferPool::CapacityClassFor(size_t min_capacity)
  {
    size_t capacity = kMinClassBytes;
    while (capacity < min_capacity)
    {
      capacity <<= 1;
    }
    return capacity;
  }

  PooledBuffer BufferPool::Acquire(size_t min_capacity)
  {
    return AcquireInternal(min_capacity, true, nullptr);
  }

  PooledBuffer BufferPool::Acquire(size_t min_capacity, const std::atomic<bool> &cancel)
  {
    return AcquireInternal(min_capacity, true, &cancel);
  }

  PooledBuffer BufferPool::TryAcquire(size_t min_capacity)
  {
    return AcquireInternal(min_capacity, false, nullptr);
  }

  PooledBuffer BufferPool::AcquireInternal(size_t min_capacity, bool wait,
                                           const std::atomic<bool> *cancel)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (min_capacity > config_.max_buffer_bytes)
    {
      stats_.rejected++;
      std::cerr << "[BufferPool] Request of " << min_capacity
                << " bytes exceeds max_buffer_bytes " << config_.max_buffer_bytes
                << std::endl;
      return PooledBuffer();
    }
    const size_t capacity = CapacityClassFor(min_capacity);

    if (config_.max_outstanding_bytes != 0)
    {
      auto has_room = [&]
      {
        return shutdown_ ||
               stats_.outstanding_bytes + capacity <= config_.max_outstanding_bytes;
      };
      if (!has_room())
      {
        if (!wait)
        {
          stats_.rejected++;
          return PooledBuffer();
        }
        if (cancel == nullptr)
        {
          capacity_cv_.wait(lock, has_room);
        }
        else
        {
          // Setting `cancel` does not notify capacity_cv_, so poll it.
          while (!has_room())
          {
            if (cancel->load(std::memory_order_acquire))
            {
              stats_.rejected++;
              return PooledBuffer();
            }
            capacity_cv_.wait_for(lock, kCancelPollInterval);
          }
        }
      }
    }

    if (shutdown_)
    {
      stats_.rejected++;
      return PooledBuffer();
    }

    std::unique_ptr<uint8_t[]> block;
    auto it = idle_.find(capacity);
    if (it != idle_.end() && !it->second.empty())
    {
      block = std::move(it->second.back());
      it->second.pop_back();
      stats_.idle_buffers--;
      stats_.idle_bytes -= capacity;
      stats_.reuses++;
    }
    else
    {
      block.reset(new uint8_t[capacity]);
      stats_.allocations++;
    }

    stats_.outstanding_buffers++;
    stats_.outstanding_bytes += capacity;
    lock.unlock();

    return PooledBuffer(shared_from_this(), std::move(block), capacity);
  }

  void BufferPool::Release(std::unique_ptr<uint8_t[]> block, size_t capacity)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stats_.outstanding_buffers--;
      stats_.outstanding_bytes -= capacity;

      if (stats_.idle_bytes + capacity <= config_.max_pool_bytes)
      {
        idle_[capacity].push_back(std::move(block));
        stats_.idle_buffers++;
        stats_.idle_bytes += capacity;
        stats_.recycled++;
      }
      else
      {
        stats_.freed++;
      }
    }
    capacity_cv_.notify_all();
    // A block that was not recycled is freed here, outside the lock.
  }

  void BufferPool::Shutdown()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_ = true;
    }
    capacity_cv_.notify_all();
  }

  BufferPoolStats BufferPool::GetStats() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
  }

} // namespace aqueduct::buffer
