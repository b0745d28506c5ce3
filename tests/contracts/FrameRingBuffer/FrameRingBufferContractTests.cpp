// Repository: Aqueduct
// Component: Frame Ring Buffer Contract Tests
// Purpose: Verifies the single-producer single-consumer hand-off to the renderer.
// Copyright (c) 2025 RetroVue

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/buffer/FrameRingBuffer.h"
#include "fixtures/FrameFactory.h"

namespace aqueduct::tests
{
  namespace
  {

    using aqueduct::tests::RegisterExpectedDomainCoverage;
    using buffer::FrameRingBuffer;

    const bool kRegisterCoverage = []()
    {
      RegisterExpectedDomainCoverage("FrameRingBuffer", {"FRB-001", "FRB-002", "FRB-003"});
      return true;
    }();

    class FrameRingBufferContractTest : public BaseContractTest
    {
    protected:
      [[nodiscard]] std::string DomainName() const override
      {
        return "FrameRingBuffer";
      }

      [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
      {
        return {"FRB-001", "FRB-002", "FRB-003"};
      }

      void SetUp() override
      {
        BaseContractTest::SetUp();
        pool_ = buffer::BufferPool::Create(buffer::BufferPoolConfig());
        ASSERT_NE(pool_, nullptr);
        factory_ = std::make_unique<fixtures::FrameFactory>(pool_);
      }

      std::shared_ptr<buffer::BufferPool> pool_;
      std::unique_ptr<fixtures::FrameFactory> factory_;
    };

    // Rule: FRB-001 Frames come out in push order; a full buffer refuses without consuming
    TEST_F(FrameRingBufferContractTest, FRB_001_FifoAndFullRefusal)
    {
      FrameRingBuffer ring(4);
      EXPECT_EQ(ring.Capacity(), 4u);
      EXPECT_TRUE(ring.IsEmpty());
      EXPECT_EQ(ring.Peek(), nullptr);

      for (uint8_t i = 0; i < 3; ++i)
      {
        media::MediaFrame frame = factory_->CreateVideo(2, 2, i);
        frame.timestamp_us = i;
        ASSERT_TRUE(ring.Push(std::move(frame)));
      }
      EXPECT_TRUE(ring.IsFull());
      EXPECT_EQ(ring.Size(), 3u);

      media::MediaFrame rejected = factory_->CreateVideo(2, 2, 9);
      EXPECT_FALSE(ring.Push(std::move(rejected)));
      EXPECT_NE(rejected.data(), nullptr);

      ASSERT_NE(ring.Peek(), nullptr);
      EXPECT_EQ(ring.Peek()->timestamp_us, 0u);

      for (uint64_t expected = 0; expected < 3; ++expected)
      {
        media::MediaFrame out;
        ASSERT_TRUE(ring.Pop(out));
        EXPECT_EQ(out.timestamp_us, expected);
        EXPECT_EQ(out.data()[0], static_cast<uint8_t>(expected));
      }
      media::MediaFrame none;
      EXPECT_FALSE(ring.Pop(none));
    }

    // Rule: FRB-002 Clear returns buffered storage to the pool
    TEST_F(FrameRingBufferContractTest, FRB_002_ClearReleasesFrames)
    {
      FrameRingBuffer ring(8);
      for (int i = 0; i < 5; ++i)
      {
        ASSERT_TRUE(ring.Push(factory_->CreateAudio(64)));
      }
      EXPECT_EQ(pool_->GetStats().outstanding_buffers, 5u);

      ring.Clear();
      EXPECT_TRUE(ring.IsEmpty());
      EXPECT_EQ(pool_->GetStats().outstanding_buffers, 0u);

      // A degenerate capacity still leaves one usable slot.
      FrameRingBuffer tiny(0);
      EXPECT_EQ(tiny.Capacity(), 2u);
      EXPECT_TRUE(tiny.Push(factory_->CreateMetadata("<a/>")));
      EXPECT_TRUE(tiny.IsFull());
    }

    // Rule: FRB-003 One producer and one consumer exchange frames without loss
    TEST_F(FrameRingBufferContractTest, FRB_003_ConcurrentProducerConsumer)
    {
      constexpr uint64_t kFrames = 2000;
      FrameRingBuffer ring(8);

      std::thread producer([&]()
                           {
        for (uint64_t i = 0; i < kFrames; ++i) {
          media::MediaFrame frame = factory_->CreateMetadata("x");
          frame.timestamp_us = i;
          while (!ring.Push(std::move(frame))) {
            std::this_thread::yield();
          }
        } });

      uint64_t next = 0;
      bool ordered = true;
      while (next < kFrames)
      {
        media::MediaFrame frame;
        if (ring.Pop(frame))
        {
          ordered = ordered && frame.timestamp_us == next;
          ++next;
        }
        else
        {
          std::this_thread::yield();
        }
      }
      producer.join();
      EXPECT_TRUE(ordered);
      EXPECT_TRUE(ring.IsEmpty());
    }

  } // namespace
} // namespace aqueduct::tests
