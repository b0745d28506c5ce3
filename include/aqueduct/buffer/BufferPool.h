// Repository: Aqueduct
// Component: Buffer Pool
// Purpose: Power-of-two bucketed pool of reusable byte blocks with scoped release.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_BUFFER_BUFFER_POOL_H_
#define AQUEDUCT_BUFFER_BUFFER_POOL_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace aqueduct::buffer
{

  class BufferPool;

  // BufferPoolConfig bounds how much memory the pool may retain and hand out.
  struct BufferPoolConfig
  {
    // Idle bytes retained for reuse. Releases that would exceed this free
    // the block instead of recycling it.
    size_t max_pool_bytes = 256u * 1024u * 1024u;

    // Cap on bytes checked out at once (0 = unlimited). When set, Acquire()
    // waits for a release instead of growing past the cap.
    size_t max_outstanding_bytes = 0;

    // Largest single request the pool will serve.
    size_t max_buffer_bytes = 128u * 1024u * 1024u;
  };

  // BufferPoolStats is a consistent snapshot of pool accounting.
  //
  // Conservation: allocations + reuses == recycled + freed + outstanding_buffers.
  struct BufferPoolStats
  {
    uint64_t allocations = 0; // New blocks created
    uint64_t reuses = 0;      // Idle blocks handed out again
    uint64_t recycled = 0;    // Releases returned to the idle set
    uint64_t freed = 0;       // Releases that freed the block (idle cap reached)
    uint64_t rejected = 0;    // Requests that could not be served
    size_t outstanding_buffers = 0;
    size_t outstanding_bytes = 0;
    size_t idle_buffers = 0;
    size_t idle_bytes = 0;
  };

  // PooledBuffer is a move-only handle to a pool-owned byte block.
  //
  // The block returns to its pool when the handle is destroyed or Reset(),
  // on every exit path. A default-constructed or moved-from handle is empty.
  class PooledBuffer
  {
  public:
    PooledBuffer() = default;
    ~PooledBuffer();

    PooledBuffer(const PooledBuffer &) = delete;
    PooledBuffer &operator=(const PooledBuffer &) = delete;

    PooledBuffer(PooledBuffer &&other) noexcept;
    PooledBuffer &operator=(PooledBuffer &&other) noexcept;

    uint8_t *data() { return block_.get(); }
    const uint8_t *data() const { return block_.get(); }

    // Bytes the block can hold.
    size_t capacity() const { return capacity_; }

    // Bytes currently in use. Never exceeds capacity().
    size_t size() const { return size_; }

    // Sets the used length. Returns false (and leaves size unchanged) if
    // `size` exceeds capacity().
    bool set_size(size_t size);

    bool valid() const { return block_ != nullptr; }
    explicit operator bool() const { return valid(); }

    // Returns the block to its pool now. The handle becomes empty.
    void Reset();

  private:
    friend class BufferPool;

    PooledBuffer(std::shared_ptr<BufferPool> pool,
                 std::unique_ptr<uint8_t[]> block,
                 size_t capacity);

    std::shared_ptr<BufferPool> pool_;
    std::unique_ptr<uint8_t[]> block_;
    size_t capacity_ = 0;
    size_t size_ = 0;
  };

  // SharedBuffer is a reference-counted, read-only view of one PooledBuffer.
  // The sender fans one encoded packet out to several connections with it;
  // the block returns to the pool when the last reference drops.
  using SharedBuffer = std::shared_ptr<const PooledBuffer>;

  inline SharedBuffer Share(PooledBuffer &&buffer)
  {
    return SharedBuffer(std::make_shared<PooledBuffer>(std::move(buffer)));
  }

  // BufferPool amortizes payload allocation across the hot path.
  //
  // Policy:
  // - Requests are rounded up to a power-of-two capacity class (minimum
  //   kMinClassBytes) to bound fragmentation.
  // - Acquire() reuses an idle block of the class or allocates a new one.
  // - Release (via PooledBuffer) recycles the block unless the idle set
  //   would exceed max_pool_bytes, in which case the block is freed.
  //
  // Thread Model:
  // - All operations are serialized by one mutex and may be called from any
  //   thread. Handles keep the pool alive, so blocks can outlive the owner
  //   that created the pool.
  class BufferPool : public std::enable_shared_from_this<BufferPool>
  {
  public:
    static constexpr size_t kMinClassBytes = 256;
    static constexpr std::chrono::milliseconds kCancelPollInterval{20};

    // Validates `config` and creates a pool. Returns nullptr (and logs) on
    // an invalid configuration.
    static std::shared_ptr<BufferPool> Create(const BufferPoolConfig &config);

    ~BufferPool();

    BufferPool(const BufferPool &) = delete;
    BufferPool &operator=(const BufferPool &) = delete;

    // Returns a buffer with capacity >= min_capacity and size() == 0.
    // Waits while max_outstanding_bytes is reached. Returns an empty handle
    // if the request exceeds max_buffer_bytes or the pool is shut down.
    PooledBuffer Acquire(size_t min_capacity);

    // Same as Acquire() but gives up with an empty handle once `cancel` is
    // set. The flag is rechecked every kCancelPollInterval while waiting.
    PooledBuffer Acquire(size_t min_capacity, const std::atomic<bool> &cancel);

    // Same as Acquire() but never waits; returns an empty handle instead.
    PooledBuffer TryAcquire(size_t min_capacity);

    // Wakes any waiting Acquire() calls, which then return empty handles.
    // Outstanding buffers are still accepted back.
    void Shutdown();

    BufferPoolStats GetStats() const;

    const BufferPoolConfig &config() const { return config_; }

    // Capacity class a request of `min_capacity` bytes is served from.
    static size_t CapacityClassFor(size_t min_capacity);

  private:
    friend class PooledBuffer;

    explicit BufferPool(const BufferPoolConfig &config);

    PooledBuffer AcquireInternal(size_t min_capacity, bool wait,
                                 const std::atomic<bool> *cancel);
    void Release(std::unique_ptr<uint8_t[]> block, size_t capacity);

    const BufferPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable capacity_cv_;
    bool shutdown_ = false;

    // Idle blocks keyed by capacity class.
    std::map<size_t, std::vector<std::unique_ptr<uint8_t[]>>> idle_;
    BufferPoolStats stats_;
  };

} // namespace aqueduct::buffer

#endif // AQUEDUCT_BUFFER_BUFFER_POOL_H_
