// Repository: Aqueduct
// Component: Packet Queue Contract Tests
// Purpose: Verifies bounded backpressure and the drop-oldest overload policy.
// Copyright (c) 2025 RetroVue

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/buffer/PacketQueue.h"

namespace aqueduct::tests
{
  namespace
  {

    using aqueduct::tests::RegisterExpectedDomainCoverage;
    using buffer::OutboundPacket;
    using buffer::OverloadPolicy;
    using buffer::PacketQueue;
    using buffer::PushResult;

    const bool kRegisterCoverage = []()
    {
      RegisterExpectedDomainCoverage("PacketQueue",
                                     {"PQ-001", "PQ-002", "PQ-003", "PQ-004", "PQ-005"});
      return true;
    }();

    class PacketQueueContractTest : public BaseContractTest
    {
    protected:
      [[nodiscard]] std::string DomainName() const override
      {
        return "PacketQueue";
      }

      [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
      {
        return {"PQ-001", "PQ-002", "PQ-003", "PQ-004", "PQ-005"};
      }

      void SetUp() override
      {
        BaseContractTest::SetUp();
        pool_ = buffer::BufferPool::Create(buffer::BufferPoolConfig());
        ASSERT_NE(pool_, nullptr);
      }

      // Packet whose first payload byte is `tag`, so tests can tell packets apart.
      OutboundPacket MakePacket(wire::PacketType type, uint32_t flags, uint8_t tag,
                                size_t size = 64)
      {
        buffer::PooledBuffer block = pool_->Acquire(size);
        block.set_size(size);
        block.data()[0] = tag;
        OutboundPacket packet;
        packet.buffer = buffer::Share(std::move(block));
        packet.offset = 0;
        packet.size = size;
        packet.type = type;
        packet.flags = flags;
        return packet;
      }

      std::shared_ptr<buffer::BufferPool> pool_;
    };

    // Rule: PQ-001 A full queue holds the producer instead of growing
    TEST_F(PacketQueueContractTest, PQ_001_FullQueueAppliesBackpressure)
    {
      PacketQueue queue(2, OverloadPolicy::kBlock);
      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kVideo, 0, 1)), PushResult::kQueued);
      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kVideo, 0, 2)), PushResult::kQueued);

      EXPECT_EQ(queue.Push(MakePacket(wire::PacketType::kVideo, 0, 3), 20'000),
                PushResult::kTimedOut);
      EXPECT_EQ(queue.Size(), 2u);
      EXPECT_EQ(queue.Dropped(), 0u);
      EXPECT_EQ(queue.Bytes(), 128u);

      std::atomic<bool> pushed{false};
      std::thread producer([&]()
                           {
        pushed.store(queue.Push(MakePacket(wire::PacketType::kVideo, 0, 4)) ==
                     PushResult::kQueued); });
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      EXPECT_FALSE(pushed.load());

      OutboundPacket popped;
      ASSERT_TRUE(queue.Pop(popped));
      EXPECT_EQ(popped.data()[0], 1);
      producer.join();
      EXPECT_TRUE(pushed.load());
      EXPECT_EQ(queue.Size(), 2u);
      EXPECT_EQ(queue.HighWaterBytes(), 128u);
    }

    // Rule: PQ-002 Drop-oldest evicts delta video and audio only
    TEST_F(PacketQueueContractTest, PQ_002_DropOldestKeepsKeyFramesAndMetadata)
    {
      PacketQueue queue(3, OverloadPolicy::kDropOldest);
      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kVideo, wire::flags::kKeyFrame, 1)),
                PushResult::kQueued);
      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kMetadata, 0, 2)),
                PushResult::kQueued);
      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kAudio, 0, 3)), PushResult::kQueued);

      // Full: the audio packet is the only droppable one.
      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kVideo, 0, 4)), PushResult::kQueued);
      EXPECT_EQ(queue.Dropped(), 1u);

      std::vector<uint8_t> order;
      queue.Close(false);
      OutboundPacket packet;
      while (queue.Pop(packet))
      {
        order.push_back(packet.data()[0]);
      }
      EXPECT_EQ(order, (std::vector<uint8_t>{1, 2, 4}));
    }

    // Rule: PQ-003 With nothing droppable, drop-oldest waits like block
    TEST_F(PacketQueueContractTest, PQ_003_DropOldestBlocksWhenNothingDroppable)
    {
      PacketQueue queue(2, OverloadPolicy::kDropOldest);
      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kVideo, wire::flags::kKeyFrame, 1)),
                PushResult::kQueued);
      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kControl, 0, 2)), PushResult::kQueued);

      EXPECT_EQ(queue.Push(MakePacket(wire::PacketType::kAudio, 0, 3), 20'000),
                PushResult::kTimedOut);
      EXPECT_EQ(queue.Dropped(), 0u);
      EXPECT_EQ(queue.Size(), 2u);
    }

    // Rule: PQ-004 Close wakes producers and optionally discards pending packets
    TEST_F(PacketQueueContractTest, PQ_004_CloseUnblocksAndDiscards)
    {
      PacketQueue queue(1, OverloadPolicy::kBlock);
      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kVideo, 0, 1)), PushResult::kQueued);

      std::atomic<int> result{-1};
      std::thread producer([&]()
                           { result.store(static_cast<int>(
                                 queue.Push(MakePacket(wire::PacketType::kVideo, 0, 2)))); });
      std::this_thread::sleep_for(std::chrono::milliseconds(20));

      queue.Close(true);
      producer.join();
      EXPECT_EQ(result.load(), static_cast<int>(PushResult::kClosed));
      EXPECT_TRUE(queue.IsClosed());
      EXPECT_EQ(queue.Size(), 0u);
      EXPECT_EQ(queue.Bytes(), 0u);

      OutboundPacket packet;
      EXPECT_FALSE(queue.Pop(packet));
      EXPECT_EQ(queue.Push(MakePacket(wire::PacketType::kVideo, 0, 3)), PushResult::kClosed);

      // Discarded packets went back to the pool.
      EXPECT_EQ(pool_->GetStats().outstanding_buffers, 0u);
    }

    // Rule: PQ-005 A consumer drains pending packets after a non-discarding close
    TEST_F(PacketQueueContractTest, PQ_005_WaitUntilEmptyTracksConsumer)
    {
      PacketQueue queue(0, OverloadPolicy::kBlock);
      EXPECT_EQ(queue.Capacity(), 1u);
      EXPECT_TRUE(queue.WaitUntilEmpty(1'000));

      ASSERT_EQ(queue.Push(MakePacket(wire::PacketType::kAudio, 0, 9)), PushResult::kQueued);
      EXPECT_FALSE(queue.WaitUntilEmpty(10'000));

      std::thread consumer([&]()
                           {
        OutboundPacket packet;
        while (queue.Pop(packet)) {
        } });

      EXPECT_TRUE(queue.WaitUntilEmpty(1'000'000));
      queue.Close(false);
      consumer.join();
      EXPECT_STREQ(buffer::OverloadPolicyToString(OverloadPolicy::kDropOldest), "drop-oldest");
    }

  } // namespace
} // namespace aqueduct::tests
