// Repository: Aqueduct
// Component: Sender Contract Tests
// Purpose: Checks validation, wire output, fan-out isolation and shutdown of the Sender.
// Copyright (c) 2025 RetroVue

#include "../../BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/codec/PassthroughCodec.h"
#include "aqueduct/media/MediaDescriptors.h"
#include "aqueduct/sender/Sender.h"
#include "aqueduct/wire/PacketCodec.h"
#include "fixtures/FrameFactory.h"
#include "fixtures/StubCodec.h"
#include "fixtures/TestTcpClient.h"

namespace aqueduct::tests
{
  namespace
  {

    using aqueduct::tests::RegisterExpectedDomainCoverage;
    using fixtures::FrameFactory;
    using fixtures::TestTcpClient;
    using sender::Sender;
    using sender::SenderConfig;
    using wire::PacketType;

    const bool kRegisterCoverage = []()
    {
      RegisterExpectedDomainCoverage("Sender",
                                     {"SND-001", "SND-002", "SND-003", "SND-004", "SND-005",
                                      "SND-006", "SND-007", "SND-008", "SND-009"});
      return true;
    }();

    bool WaitUntil(const std::function<bool()> &condition, int timeout_ms = 2000)
    {
      const auto deadline =
          std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
      while (std::chrono::steady_clock::now() < deadline)
      {
        if (condition())
        {
          return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      return condition();
    }

    // Reads one framed packet from `client`.
    bool ReadPacket(TestTcpClient &client, wire::PacketHeader *header,
                    std::vector<uint8_t> *payload)
    {
      uint8_t raw[wire::kHeaderSize];
      if (!client.ReadExact(raw, sizeof(raw)))
      {
        return false;
      }
      if (wire::DecodeHeader(raw, sizeof(raw), wire::kDefaultMaxPayloadBytes, header) !=
          wire::WireStatus::kOk)
      {
        return false;
      }
      payload->assign(header->length, 0);
      return header->length == 0 || client.ReadExact(payload->data(), payload->size());
    }

    class SenderContractTest : public BaseContractTest
    {
    protected:
      [[nodiscard]] std::string DomainName() const override
      {
        return "Sender";
      }

      [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
      {
        return {"SND-001", "SND-002", "SND-003", "SND-004", "SND-005",
                "SND-006", "SND-007", "SND-008", "SND-009"};
      }

      void SetUp() override
      {
        BaseContractTest::SetUp();
        pool_ = buffer::BufferPool::Create(buffer::BufferPoolConfig());
        ASSERT_NE(pool_, nullptr);
        factory_ = std::make_unique<FrameFactory>(pool_);
        config_.bind_host = "127.0.0.1";
        config_.port = 0;
        config_.advertise = false;
        config_.drain_timeout_ms = 500;
      }

      std::unique_ptr<Sender> StartSender(
          std::unique_ptr<codec::ICodec> codec = std::make_unique<codec::PassthroughCodec>())
      {
        auto sender = std::make_unique<Sender>(config_, pool_, std::move(codec));
        EXPECT_TRUE(sender->Start());
        EXPECT_NE(sender->GetPort(), 0);
        return sender;
      }

      // Connects a raw receiver and waits for the sender to register it.
      TestTcpClient Attach(Sender &sender, size_t expected_connections)
      {
        TestTcpClient client = fixtures::ConnectTo(sender.GetPort());
        EXPECT_TRUE(client.IsConnected());
        EXPECT_TRUE(WaitUntil([&]
                              { return sender.ConnectionCount() == expected_connections; }));
        return client;
      }

      std::shared_ptr<buffer::BufferPool> pool_;
      std::unique_ptr<FrameFactory> factory_;
      SenderConfig config_;
    };

    // Rule: SND-001 Frames that contradict their descriptor are rejected before framing
    TEST_F(SenderContractTest, SND_001_RejectsInvalidFrames)
    {
      Sender idle(config_, pool_, std::make_unique<codec::PassthroughCodec>());
      EXPECT_FALSE(idle.SubmitFrame(factory_->CreateVideo(4, 2)));

      auto sender = StartSender();

      {
        media::MediaFrame short_video = factory_->CreateVideo(4, 2);
        short_video.size -= 1;
        EXPECT_FALSE(sender->SubmitFrame(std::move(short_video)));

        media::MediaFrame zero_video = factory_->CreateVideo(4, 2);
        zero_video.video.width = 0;
        EXPECT_FALSE(sender->SubmitFrame(std::move(zero_video)));

        media::MediaFrame bad_audio = factory_->CreateAudio(16);
        bad_audio.audio.channels = 6;
        EXPECT_FALSE(sender->SubmitFrame(std::move(bad_audio)));

        // A view with no storage behind it.
        media::MediaFrame hollow;
        hollow.type = PacketType::kMetadata;
        hollow.size = 64;
        EXPECT_FALSE(sender->SubmitFrame(std::move(hollow)));

        // A view running past the end of its storage.
        media::MediaFrame overrun = factory_->CreateMetadata("<overrun/>");
        overrun.offset = overrun.storage.capacity() - 2;
        overrun.size = 8;
        EXPECT_FALSE(sender->SubmitFrame(std::move(overrun)));
      }

      EXPECT_TRUE(sender->SubmitFrame(factory_->CreateMetadata("<ok/>")));

      const sender::SenderStats stats = sender->GetStats();
      EXPECT_EQ(stats.frames_submitted, 6u);
      EXPECT_EQ(stats.frames_rejected, 5u);
      EXPECT_EQ(stats.frames_sent, 1u);
      EXPECT_EQ(stats.frames_without_peers, 1u);

      // Rejected frames are left with the caller; once they are gone nothing
      // stays checked out.
      EXPECT_EQ(pool_->GetStats().outstanding_buffers, 0u);
    }

    // Rule: SND-002 Receivers get header, descriptor and pixels exactly as framed
    TEST_F(SenderContractTest, SND_002_WireLayoutAndTimestampOrder)
    {
      auto sender = StartSender();
      TestTcpClient client = Attach(*sender, 1);

      ASSERT_TRUE(sender->SubmitFrame(factory_->CreateVideo(4, 2, 3)));
      ASSERT_TRUE(sender->SubmitFrame(factory_->CreateTightVideo(2, 2)));
      ASSERT_TRUE(sender->SubmitFrame(factory_->CreateAudio(4)));

      wire::PacketHeader header;
      std::vector<uint8_t> payload;

      ASSERT_TRUE(ReadPacket(client, &header, &payload));
      EXPECT_EQ(header.type, PacketType::kVideo);
      EXPECT_TRUE(header.IsKeyFrame());
      EXPECT_FALSE(header.IsCompressed());
      ASSERT_EQ(payload.size(), media::kVideoDescriptorSize + 32u);
      media::VideoDescriptor desc;
      ASSERT_TRUE(media::DecodeVideoDescriptor(payload.data(), payload.size(), &desc));
      EXPECT_EQ(desc.width, 4u);
      EXPECT_EQ(desc.height, 2u);
      EXPECT_EQ(desc.pixel_format, media::PixelFormat::kBGRA);
      EXPECT_EQ(desc.raw_size, 32u);
      for (size_t i = 0; i < 32; ++i)
      {
        ASSERT_EQ(payload[media::kVideoDescriptorSize + i], static_cast<uint8_t>(3 + i));
      }
      const uint64_t first_video_ts = header.timestamp_us;

      // Copied path: a frame with no headroom looks the same on the wire.
      ASSERT_TRUE(ReadPacket(client, &header, &payload));
      EXPECT_EQ(header.type, PacketType::kVideo);
      EXPECT_GT(header.timestamp_us, first_video_ts);
      EXPECT_EQ(payload.size(), media::kVideoDescriptorSize + 16u);

      ASSERT_TRUE(ReadPacket(client, &header, &payload));
      EXPECT_EQ(header.type, PacketType::kAudio);
      media::AudioDescriptor audio;
      ASSERT_TRUE(media::DecodeAudioDescriptor(payload.data(), payload.size(), &audio));
      EXPECT_EQ(audio.samples_per_channel, 4u);
      EXPECT_EQ(audio.channels, 2u);
      EXPECT_EQ(payload.size(), media::kAudioDescriptorSize + audio.SampleBytes());

      EXPECT_EQ(sender->GetStats().packets_enqueued, 3u);
    }

    // Rule: SND-003 A receiver that goes away does not disturb the others
    TEST_F(SenderContractTest, SND_003_FailedConnectionIsIsolated)
    {
      auto sender = StartSender();
      TestTcpClient doomed = Attach(*sender, 1);
      TestTcpClient survivor = Attach(*sender, 2);

      doomed.Close();
      // Writes to the closed peer fail after the first reset; keep sending
      // until the sender notices.
      ASSERT_TRUE(WaitUntil(
          [&]
          {
            sender->SubmitFrame(factory_->CreateVideo(2, 2));
            return sender->ConnectionCount() == 1;
          },
          5000));

      ASSERT_TRUE(sender->SubmitFrame(factory_->CreateMetadata("<last/>")));

      wire::PacketHeader header;
      std::vector<uint8_t> payload;
      bool saw_metadata = false;
      while (!saw_metadata && ReadPacket(survivor, &header, &payload))
      {
        saw_metadata = header.type == PacketType::kMetadata;
      }
      EXPECT_TRUE(saw_metadata);
      EXPECT_EQ(std::string(payload.begin(), payload.end()), "<last/>");
      EXPECT_TRUE(sender->IsRunning());
    }

    // Rule: SND-004 CloseConnection ends one receiver by id
    TEST_F(SenderContractTest, SND_004_CloseConnectionById)
    {
      auto sender = StartSender();
      TestTcpClient client = Attach(*sender, 1);

      const std::vector<sender::ConnectionInfo> connections = sender->ListConnections();
      ASSERT_EQ(connections.size(), 1u);
      EXPECT_TRUE(connections[0].open);
      EXPECT_FALSE(connections[0].peer.empty());

      const uint64_t id = connections[0].id;
      EXPECT_TRUE(sender->CloseConnection(id));
      EXPECT_FALSE(sender->CloseConnection(id));
      EXPECT_TRUE(client.WaitForPeerClose());
      EXPECT_EQ(sender->ConnectionCount(), 0u);
      EXPECT_EQ(sender->GetStats().connections_closed, 1u);
    }

    // Rule: SND-005 Connections beyond max_connections are refused
    TEST_F(SenderContractTest, SND_005_RefusesBeyondMaxConnections)
    {
      config_.max_connections = 1;
      auto sender = StartSender();
      TestTcpClient first = Attach(*sender, 1);

      TestTcpClient second = fixtures::ConnectTo(sender->GetPort());
      EXPECT_TRUE(second.WaitForPeerClose());
      EXPECT_TRUE(WaitUntil([&] { return sender->GetStats().connections_refused == 1; }));

      const sender::SenderStats stats = sender->GetStats();
      EXPECT_EQ(stats.connections_accepted, 1u);
      EXPECT_EQ(stats.active_connections, 1u);
    }

    // Rule: SND-006 A frame the codec fails on is dropped and counted
    TEST_F(SenderContractTest, SND_006_CodecErrorDropsFrame)
    {
      auto codec = std::make_unique<fixtures::StubCodec>();
      auto codec_state = codec->state();
      codec_state->fail_compress_every.store(2);
      auto sender = StartSender(std::move(codec));
      TestTcpClient client = Attach(*sender, 1);

      EXPECT_TRUE(sender->SubmitFrame(factory_->CreateVideo(4, 2, 1)));
      EXPECT_FALSE(sender->SubmitFrame(factory_->CreateVideo(4, 2, 2)));
      EXPECT_TRUE(sender->SubmitFrame(factory_->CreateVideo(4, 2, 3)));

      const sender::SenderStats stats = sender->GetStats();
      EXPECT_EQ(stats.codec_errors, 1u);
      EXPECT_EQ(stats.frames_compressed, 2u);
      EXPECT_EQ(stats.frames_sent, 2u);

      wire::PacketHeader header;
      std::vector<uint8_t> payload;
      ASSERT_TRUE(ReadPacket(client, &header, &payload));
      EXPECT_TRUE(header.IsCompressed());
      EXPECT_EQ(payload[media::kVideoDescriptorSize], 1);
      ASSERT_TRUE(ReadPacket(client, &header, &payload));
      EXPECT_TRUE(header.IsCompressed());
      EXPECT_EQ(payload[media::kVideoDescriptorSize], 3);
    }

    // Rule: SND-007 Stop delivers queued packets, then end-of-stream, then closes
    TEST_F(SenderContractTest, SND_007_StopSendsEndOfStream)
    {
      auto sender = StartSender();
      TestTcpClient client = Attach(*sender, 1);

      ASSERT_TRUE(sender->SubmitFrame(factory_->CreateMetadata("<bye/>")));
      sender->Stop();
      EXPECT_FALSE(sender->IsRunning());
      EXPECT_FALSE(sender->SubmitFrame(factory_->CreateMetadata("<late/>")));

      wire::PacketHeader header;
      std::vector<uint8_t> payload;
      ASSERT_TRUE(ReadPacket(client, &header, &payload));
      EXPECT_EQ(header.type, PacketType::kMetadata);
      const uint64_t metadata_ts = header.timestamp_us;

      ASSERT_TRUE(ReadPacket(client, &header, &payload));
      EXPECT_EQ(header.type, PacketType::kControl);
      EXPECT_TRUE(header.IsEndOfStream());
      EXPECT_EQ(header.length, 0u);
      EXPECT_GE(header.timestamp_us, metadata_ts);

      EXPECT_TRUE(client.WaitForPeerClose());
      EXPECT_EQ(sender->GetStats().connections_closed, 1u);
    }

    // Rule: SND-008 A receiver that stops reading suspends the producer with bounded queue memory
    TEST_F(SenderContractTest, SND_008_BlockPolicyBoundsQueueAndSuspendsProducer)
    {
      constexpr size_t kQueueCapacity = 4;
      constexpr int kFrames = 400;
      config_.queue_capacity = kQueueCapacity;
      config_.max_payload_bytes = 64 * 1024;
      config_.send_buffer_bytes = 16 * 1024;
      config_.overload_policy = buffer::OverloadPolicy::kBlock;
      auto sender = StartSender();
      // Connected but never read from.
      TestTcpClient stalled = Attach(*sender, 1);

      const std::string body(60000, 'm');
      std::atomic<int> submitted{0};
      std::atomic<bool> finished{false};
      std::thread producer([&]()
                           {
        for (int i = 0; i < kFrames; ++i)
        {
          sender->SubmitFrame(factory_->CreateMetadata(body));
          submitted.fetch_add(1);
        }
        finished.store(true); });

      // Socket buffers fill, then the queue, then SubmitFrame stops returning.
      ASSERT_TRUE(WaitUntil(
          [&]
          {
            const int before = submitted.load();
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return before > 0 && submitted.load() == before;
          },
          10000));
      EXPECT_FALSE(finished.load());
      EXPECT_LT(submitted.load(), kFrames);

      const std::vector<sender::ConnectionInfo> connections = sender->ListConnections();
      ASSERT_EQ(connections.size(), 1u);
      EXPECT_EQ(connections[0].queued_packets, kQueueCapacity);
      EXPECT_GT(connections[0].high_water_bytes, 0u);
      EXPECT_LE(connections[0].high_water_bytes,
                kQueueCapacity * (config_.max_payload_bytes + wire::kHeaderSize));
      EXPECT_EQ(sender->GetStats().packets_dropped, 0u);

      // Stop releases the suspended producer.
      sender->Stop();
      producer.join();
      EXPECT_TRUE(finished.load());
    }

    // Rule: SND-009 Under drop-oldest only non-key video and audio are evicted
    TEST_F(SenderContractTest, SND_009_DropOldestSparesKeyFramesAndMetadata)
    {
      constexpr int kVideoFrames = 300;
      config_.queue_capacity = 4;
      config_.max_payload_bytes = 64 * 1024;
      config_.send_buffer_bytes = 16 * 1024;
      config_.overload_policy = buffer::OverloadPolicy::kDropOldest;
      auto sender = StartSender();
      TestTcpClient client = Attach(*sender, 1);

      // 128x120 BGRA is 61440 bytes. Key frames at 0 and 150, metadata at 200;
      // with never more than three protected packets the queue always has a
      // victim, so no submit blocks.
      for (int i = 0; i < kVideoFrames; ++i)
      {
        const bool key = i == 0 || i == 150;
        ASSERT_TRUE(sender->SubmitFrame(
            factory_->CreateVideo(128, 120, static_cast<uint8_t>(i), key)));
        if (i == 200)
        {
          ASSERT_TRUE(sender->SubmitFrame(factory_->CreateMetadata("<mark/>")));
        }
      }
      EXPECT_GT(sender->GetStats().packets_dropped, 0u);

      std::thread stopper([&]()
                          { sender->Stop(); });

      int key_frames = 0;
      int other_frames = 0;
      int metadata = 0;
      bool saw_end = false;
      wire::PacketHeader header;
      std::vector<uint8_t> payload;
      while (!saw_end && ReadPacket(client, &header, &payload))
      {
        if (header.type == PacketType::kVideo)
        {
          (header.IsKeyFrame() ? key_frames : other_frames)++;
        }
        else if (header.type == PacketType::kMetadata)
        {
          metadata++;
        }
        else if (header.IsEndOfStream())
        {
          saw_end = true;
        }
      }
      stopper.join();

      EXPECT_TRUE(saw_end);
      EXPECT_EQ(key_frames, 2);
      EXPECT_EQ(metadata, 1);

      const sender::SenderStats stats = sender->GetStats();
      EXPECT_EQ(stats.frames_sent, static_cast<uint64_t>(kVideoFrames + 1));
      EXPECT_GT(stats.packets_dropped, 0u);
      EXPECT_EQ(static_cast<uint64_t>(other_frames) + stats.packets_dropped,
                static_cast<uint64_t>(kVideoFrames - 2));
    }

  } // namespace
} // namespace aqueduct::tests
