// Repository: Aqueduct
// Component: Reassembly Contract Tests
// Purpose: Verifies chunk-invariant framing and the terminal error states.
// Copyright (c) 2025 RetroVue

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/receiver/ReassemblyStateMachine.h"
#include "fixtures/FrameFactory.h"

namespace aqueduct::tests
{
  namespace
  {

    using aqueduct::tests::RegisterExpectedDomainCoverage;
    using receiver::ReassemblyState;
    using receiver::ReassemblyStateMachine;

    const bool kRegisterCoverage = []()
    {
      RegisterExpectedDomainCoverage("Reassembly",
                                     {"RSM-001", "RSM-002", "RSM-003", "RSM-004",
                                      "RSM-005", "RSM-006", "RSM-007", "RSM-008"});
      return true;
    }();

    struct Captured
    {
      wire::PacketHeader header;
      std::vector<uint8_t> payload;
    };

    class ReassemblyContractTest : public BaseContractTest
    {
    protected:
      [[nodiscard]] std::string DomainName() const override
      {
        return "Reassembly";
      }

      [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
      {
        return {"RSM-001", "RSM-002", "RSM-003", "RSM-004",
                "RSM-005", "RSM-006", "RSM-007", "RSM-008"};
      }

      void SetUp() override
      {
        BaseContractTest::SetUp();
        pool_ = buffer::BufferPool::Create(buffer::BufferPoolConfig());
        ASSERT_NE(pool_, nullptr);
      }

      receiver::PacketSink CaptureInto(std::vector<Captured> &out)
      {
        return [&out](wire::Packet &&packet)
        {
          Captured captured;
          captured.header = packet.header;
          captured.payload.assign(packet.data(), packet.data() + packet.size());
          out.push_back(std::move(captured));
        };
      }

      // Three packets of different channels back to back.
      static std::vector<uint8_t> ThreePacketStream()
      {
        std::vector<uint8_t> stream;
        auto append = [&stream](const std::vector<uint8_t> &bytes)
        {
          stream.insert(stream.end(), bytes.begin(), bytes.end());
        };
        append(fixtures::EncodePacketBytes(wire::PacketType::kVideo, 1000,
                                           wire::flags::kKeyFrame,
                                           fixtures::VideoPayload(4, 2, 0x11)));
        append(fixtures::EncodePacketBytes(wire::PacketType::kAudio, 1001, 0,
                                           std::vector<uint8_t>(37, 0x22)));
        append(fixtures::EncodePacketBytes(wire::PacketType::kMetadata, 1002, 0,
                                           std::vector<uint8_t>{'<', 'x', '/', '>'}));
        return stream;
      }

      std::shared_ptr<buffer::BufferPool> pool_;
    };

    // Rule: RSM-001 Output does not depend on how the stream is chunked
    TEST_F(ReassemblyContractTest, RSM_001_ChunkingDoesNotChangeOutput)
    {
      const std::vector<uint8_t> stream = ThreePacketStream();

      std::vector<Captured> whole;
      {
        ReassemblyStateMachine machine(pool_);
        EXPECT_EQ(machine.Feed(stream.data(), stream.size(), CaptureInto(whole)), 3u);
        EXPECT_EQ(machine.bytes_consumed(), stream.size());
        EXPECT_FALSE(machine.HasPartialPacket());
      }
      ASSERT_EQ(whole.size(), 3u);

      for (size_t chunk : {1u, 2u, 3u, 7u, 19u, 20u, 21u, 64u})
      {
        SCOPED_TRACE("chunk size " + std::to_string(chunk));
        std::vector<Captured> pieces;
        ReassemblyStateMachine machine(pool_);
        for (size_t offset = 0; offset < stream.size(); offset += chunk)
        {
          const size_t n = std::min(chunk, stream.size() - offset);
          machine.Feed(stream.data() + offset, n, CaptureInto(pieces));
        }
        ASSERT_EQ(pieces.size(), whole.size());
        for (size_t i = 0; i < whole.size(); ++i)
        {
          EXPECT_EQ(pieces[i].header, whole[i].header);
          EXPECT_EQ(pieces[i].payload, whole[i].payload);
        }
      }
    }

    // Rule: RSM-002 A key frame split mid-header and mid-payload arrives whole
    TEST_F(ReassemblyContractTest, RSM_002_SplitKeyFrameArrivesWhole)
    {
      std::vector<uint8_t> payload(1024);
      for (size_t i = 0; i < payload.size(); ++i)
      {
        payload[i] = static_cast<uint8_t>(i * 7);
      }
      const std::vector<uint8_t> bytes = fixtures::EncodePacketBytes(
          wire::PacketType::kVideo, 42, wire::flags::kKeyFrame, payload);

      std::vector<Captured> out;
      ReassemblyStateMachine machine(pool_);
      EXPECT_EQ(machine.Feed(bytes.data(), 7, CaptureInto(out)), 0u);
      EXPECT_EQ(machine.state(), ReassemblyState::kAwaitingHeader);
      EXPECT_TRUE(machine.HasPartialPacket());

      EXPECT_EQ(machine.Feed(bytes.data() + 7, 23, CaptureInto(out)), 0u);
      EXPECT_EQ(machine.state(), ReassemblyState::kAwaitingPayload);

      EXPECT_EQ(machine.Feed(bytes.data() + 30, bytes.size() - 30, CaptureInto(out)), 1u);
      ASSERT_EQ(out.size(), 1u);
      EXPECT_EQ(out[0].header.type, wire::PacketType::kVideo);
      EXPECT_EQ(out[0].header.timestamp_us, 42u);
      EXPECT_TRUE(out[0].header.IsKeyFrame());
      EXPECT_EQ(out[0].payload, payload);
      EXPECT_EQ(machine.state(), ReassemblyState::kAwaitingHeader);
    }

    // Rule: RSM-003 An unknown type closes the stream without emitting
    TEST_F(ReassemblyContractTest, RSM_003_UnknownTypeClosesWithoutEmitting)
    {
      std::vector<uint8_t> bytes = fixtures::RawHeader(4, 99, 1, 0);
      bytes.insert(bytes.end(), {1, 2, 3, 4});

      std::vector<Captured> out;
      ReassemblyStateMachine machine(pool_);
      EXPECT_EQ(machine.Feed(bytes.data(), bytes.size(), CaptureInto(out)), 0u);
      EXPECT_TRUE(out.empty());
      EXPECT_EQ(machine.state(), ReassemblyState::kClosed);
      EXPECT_EQ(machine.close_reason(), ErrorKind::kMalformedHeader);
    }

    // Rule: RSM-004 An over-limit length is a protocol violation and allocates nothing
    TEST_F(ReassemblyContractTest, RSM_004_OverLimitLengthAllocatesNothing)
    {
      const std::vector<uint8_t> header =
          fixtures::RawHeader(4096, static_cast<uint32_t>(wire::PacketType::kVideo), 0, 0);

      std::vector<Captured> out;
      ReassemblyStateMachine machine(pool_, 1024);
      machine.Feed(header.data(), header.size(), CaptureInto(out));

      EXPECT_TRUE(out.empty());
      EXPECT_EQ(machine.state(), ReassemblyState::kClosed);
      EXPECT_EQ(machine.close_reason(), ErrorKind::kProtocolViolation);
      EXPECT_EQ(pool_->GetStats().allocations, 0u);
    }

    // Rule: RSM-005 Zero-length packets are emitted on header completion
    TEST_F(ReassemblyContractTest, RSM_005_ZeroLengthPacketIsEmitted)
    {
      const std::vector<uint8_t> eos = fixtures::EncodePacketBytes(
          wire::PacketType::kControl, 77, wire::flags::kEndOfStream, {});
      ASSERT_EQ(eos.size(), wire::kHeaderSize);

      std::vector<Captured> out;
      ReassemblyStateMachine machine(pool_);
      EXPECT_EQ(machine.Feed(eos.data(), eos.size(), CaptureInto(out)), 1u);
      ASSERT_EQ(out.size(), 1u);
      EXPECT_TRUE(out[0].header.IsEndOfStream());
      EXPECT_TRUE(out[0].payload.empty());
      EXPECT_EQ(machine.packets_emitted(), 1u);
    }

    // Rule: RSM-006 Close releases partial buffers and ignores later input
    TEST_F(ReassemblyContractTest, RSM_006_CloseReleasesAndRejectsInput)
    {
      const std::vector<uint8_t> bytes = fixtures::EncodePacketBytes(
          wire::PacketType::kAudio, 5, 0, std::vector<uint8_t>(500, 0x33));

      std::vector<Captured> out;
      ReassemblyStateMachine machine(pool_);
      machine.Feed(bytes.data(), 100, CaptureInto(out));
      EXPECT_EQ(pool_->GetStats().outstanding_buffers, 1u);

      machine.Close(ErrorKind::kConnectionClosed);
      machine.Close(ErrorKind::kIo);
      EXPECT_EQ(machine.close_reason(), ErrorKind::kConnectionClosed);
      EXPECT_EQ(pool_->GetStats().outstanding_buffers, 0u);
      EXPECT_FALSE(machine.HasPartialPacket());

      EXPECT_EQ(machine.Feed(bytes.data() + 100, bytes.size() - 100, CaptureInto(out)), 0u);
      EXPECT_TRUE(out.empty());
      EXPECT_EQ(machine.PrepareRead().data, nullptr);
      EXPECT_FALSE(machine.CommitRead(1, CaptureInto(out)));
    }

    // Rule: RSM-007 The zero-copy read window lands bytes in place
    TEST_F(ReassemblyContractTest, RSM_007_ReadWindowFillsPacketInPlace)
    {
      const std::vector<uint8_t> stream = ThreePacketStream();

      std::vector<Captured> out;
      ReassemblyStateMachine machine(pool_);
      size_t offset = 0;
      while (offset < stream.size())
      {
        ReassemblyStateMachine::ReadWindow window = machine.PrepareRead();
        ASSERT_NE(window.data, nullptr);
        ASSERT_GT(window.size, 0u);
        // Deliver at most 5 bytes per "recv" to exercise partial windows.
        const size_t n = std::min({window.size, stream.size() - offset, static_cast<size_t>(5)});
        std::memcpy(window.data, stream.data() + offset, n);
        offset += n;
        ASSERT_TRUE(machine.CommitRead(n, CaptureInto(out)));
      }

      ASSERT_EQ(out.size(), 3u);
      EXPECT_EQ(out[0].header.type, wire::PacketType::kVideo);
      EXPECT_EQ(out[1].payload, std::vector<uint8_t>(37, 0x22));
      EXPECT_EQ(out[2].header.timestamp_us, 1002u);
      EXPECT_EQ(machine.bytes_consumed(), stream.size());
    }

    // Rule: RSM-008 A recorded error outlives cancellation, and cancellation ends a pool wait
    TEST_F(ReassemblyContractTest, RSM_008_FinishKeepsRecordedReason)
    {
      std::vector<Captured> out;

      // Protocol error first, local cancel second: the error is the reason.
      const std::vector<uint8_t> oversize =
          fixtures::RawHeader(4096, static_cast<uint32_t>(wire::PacketType::kVideo), 0, 0);
      ReassemblyStateMachine violated(pool_, 1024);
      violated.Feed(oversize.data(), oversize.size(), CaptureInto(out));
      EXPECT_EQ(violated.Finish(ErrorKind::kConnectionClosed, true),
                ErrorKind::kProtocolViolation);

      // Open machine: cancellation is clean, otherwise the transport reason stands.
      ReassemblyStateMachine cancelled(pool_);
      cancelled.Feed(oversize.data(), 10, CaptureInto(out));
      EXPECT_EQ(cancelled.Finish(ErrorKind::kConnectionClosed, true), ErrorKind::kNone);
      EXPECT_EQ(cancelled.state(), ReassemblyState::kClosed);

      ReassemblyStateMachine dropped(pool_);
      EXPECT_EQ(dropped.Finish(ErrorKind::kIo, false), ErrorKind::kIo);

      // A payload acquire against an exhausted pool returns once the flag is set.
      buffer::BufferPoolConfig config;
      config.max_buffer_bytes = 1024;
      config.max_outstanding_bytes = 1024;
      auto capped = buffer::BufferPool::Create(config);
      ASSERT_NE(capped, nullptr);
      buffer::PooledBuffer held = capped->Acquire(1024);
      ASSERT_TRUE(held.valid());

      std::atomic<bool> cancel{true};
      ReassemblyStateMachine starved(capped, wire::kDefaultMaxPayloadBytes, &cancel);
      const std::vector<uint8_t> header =
          fixtures::RawHeader(500, static_cast<uint32_t>(wire::PacketType::kAudio), 0, 0);
      starved.Feed(header.data(), header.size(), CaptureInto(out));
      EXPECT_EQ(starved.state(), ReassemblyState::kClosed);
      EXPECT_EQ(starved.close_reason(), ErrorKind::kNone);
      EXPECT_EQ(capped->GetStats().outstanding_buffers, 1u);
      EXPECT_TRUE(out.empty());
    }

  } // namespace
} // namespace aqueduct::tests
