// Repository: Aqueduct
// Component: Transport Integration Tests
// Purpose: Runs a loopback sender against real receivers end to end.
// Copyright (c) 2025 RetroVue

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/buffer/FrameRingBuffer.h"
#include "aqueduct/capture/SyntheticSource.h"
#include "aqueduct/receiver/Receiver.h"
#include "aqueduct/renderer/FrameRenderer.h"
#include "aqueduct/sender/Sender.h"
#include "fixtures/StubCodec.h"

namespace aqueduct::tests::integration
{
namespace
{

constexpr uint64_t kVideoFrames = 20;
constexpr uint32_t kWidth = 16;
constexpr uint32_t kHeight = 8;

bool WaitUntil(const std::function<bool()>& condition, int timeout_ms = 5000)
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

// Per-receiver view of the stream, filled from the read thread.
struct StreamLog
{
  std::mutex mutex;
  std::array<uint64_t, wire::kChannelCount> frames_by_type{};
  std::array<uint64_t, wire::kChannelCount> last_timestamp{};
  bool timestamps_increasing = true;
  uint64_t malformed_video = 0;

  void Record(const media::MediaFrame& frame)
  {
    std::lock_guard<std::mutex> lock(mutex);
    const size_t channel = wire::ChannelIndex(frame.type);
    if (frames_by_type[channel] > 0 && frame.timestamp_us <= last_timestamp[channel])
    {
      timestamps_increasing = false;
    }
    frames_by_type[channel]++;
    last_timestamp[channel] = frame.timestamp_us;
    if (frame.type == wire::PacketType::kVideo &&
        (frame.video.width != kWidth || frame.size != frame.video.raw_size))
    {
      malformed_video++;
    }
  }
};

class TransportIntegrationTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    pool_ = buffer::BufferPool::Create(buffer::BufferPoolConfig());
    ASSERT_NE(pool_, nullptr);

    sender::SenderConfig config;
    config.name = "integration";
    config.bind_host = "127.0.0.1";
    config.port = 0;
    config.advertise = false;
    sender_ = std::make_unique<sender::Sender>(config, pool_,
                                               std::make_unique<fixtures::StubCodec>());
    ASSERT_TRUE(sender_->Start());
  }

  void TearDown() override
  {
    sender_->Stop();
  }

  std::unique_ptr<receiver::Receiver> Connect(StreamLog& log,
                                              std::function<void(media::MediaFrame&&)> tap = {})
  {
    receiver::ReceiverCallbacks callbacks;
    callbacks.on_frame = [&log, tap](media::MediaFrame&& frame)
    {
      log.Record(frame);
      if (tap)
      {
        tap(std::move(frame));
      }
    };
    auto receiver = std::make_unique<receiver::Receiver>(
        receiver::ReceiverConfig(), pool_, std::make_unique<fixtures::StubCodec>(),
        std::move(callbacks));
    EXPECT_TRUE(receiver->Connect("127.0.0.1", sender_->GetPort()));
    return receiver;
  }

  std::unique_ptr<capture::SyntheticSource> MakeSource(uint64_t frames)
  {
    capture::SyntheticSourceConfig config;
    config.width = kWidth;
    config.height = kHeight;
    config.samples_per_frame = 480;
    config.metadata_interval_frames = 10;
    config.max_frames = frames;
    config.paced = false;
    return std::make_unique<capture::SyntheticSource>(config, pool_);
  }

  std::shared_ptr<buffer::BufferPool> pool_;
  std::unique_ptr<sender::Sender> sender_;
};

TEST_F(TransportIntegrationTest, EveryReceiverGetsTheWholeStream)
{
  StreamLog log_a;
  StreamLog log_b;

  // Receiver A also feeds a headless renderer.
  buffer::FrameRingBuffer preview(64);
  auto preview_renderer = renderer::FrameRenderer::Create(renderer::RenderConfig(), preview);
  ASSERT_TRUE(preview_renderer->Start());

  auto receiver_a = Connect(log_a,
                            [&preview](media::MediaFrame&& frame)
                            {
                              if (frame.type == wire::PacketType::kVideo)
                              {
                                preview.Push(std::move(frame));
                              }
                            });
  auto receiver_b = Connect(log_b);
  ASSERT_TRUE(WaitUntil([&] { return sender_->ConnectionCount() == 2; }));

  ASSERT_TRUE(sender_->AttachSource(MakeSource(kVideoFrames)));
  ASSERT_TRUE(sender_->WaitForSources(5000));
  sender_->Stop();

  ASSERT_TRUE(receiver_a->WaitForClose(5000));
  ASSERT_TRUE(receiver_b->WaitForClose(5000));

  const sender::SenderStats sent = sender_->GetStats();
  EXPECT_EQ(sent.frames_compressed, kVideoFrames);
  EXPECT_EQ(sent.codec_errors, 0u);
  EXPECT_EQ(sent.packets_dropped, 0u);

  for (receiver::Receiver* endpoint : {receiver_a.get(), receiver_b.get()})
  {
    const receiver::ReceiverStats stats = endpoint->GetStats();
    EXPECT_EQ(stats.close_reason, ErrorKind::kNone);
    EXPECT_TRUE(stats.end_of_stream);
    EXPECT_EQ(stats.frames_delivered, sent.frames_sent);
    EXPECT_EQ(stats.codec_errors, 0u);
    EXPECT_EQ(stats.clock_anomalies, 0u);
  }

  for (StreamLog* log : {&log_a, &log_b})
  {
    std::lock_guard<std::mutex> lock(log->mutex);
    EXPECT_EQ(log->frames_by_type[wire::ChannelIndex(wire::PacketType::kVideo)], kVideoFrames);
    EXPECT_EQ(log->frames_by_type[wire::ChannelIndex(wire::PacketType::kAudio)], kVideoFrames);
    EXPECT_EQ(log->frames_by_type[wire::ChannelIndex(wire::PacketType::kMetadata)], 2u);
    EXPECT_TRUE(log->timestamps_increasing);
    EXPECT_EQ(log->malformed_video, 0u);
  }

  EXPECT_TRUE(WaitUntil(
      [&] { return preview_renderer->GetStats().frames_rendered == kVideoFrames; }));
  preview_renderer->Stop();
  EXPECT_EQ(preview_renderer->GetStats().frames_rejected, 0u);
}

TEST_F(TransportIntegrationTest, ReceiverLeavingMidStreamDoesNotDisturbOthers)
{
  StreamLog log_stays;
  StreamLog log_leaves;
  auto stays = Connect(log_stays);
  auto leaves = Connect(log_leaves);
  ASSERT_TRUE(WaitUntil([&] { return sender_->ConnectionCount() == 2; }));

  ASSERT_TRUE(sender_->AttachSource(MakeSource(kVideoFrames * 10)));
  ASSERT_TRUE(WaitUntil([&] { return leaves->GetStats().frames_delivered >= 5; }));
  leaves->Close();
  EXPECT_EQ(leaves->GetStats().close_reason, ErrorKind::kNone);

  ASSERT_TRUE(sender_->WaitForSources(10000));
  sender_->Stop();

  ASSERT_TRUE(stays->WaitForClose(5000));
  const receiver::ReceiverStats stats = stays->GetStats();
  EXPECT_EQ(stats.close_reason, ErrorKind::kNone);
  EXPECT_EQ(stats.frames_delivered, sender_->GetStats().frames_sent);

  std::lock_guard<std::mutex> lock(log_stays.mutex);
  EXPECT_EQ(log_stays.frames_by_type[wire::ChannelIndex(wire::PacketType::kVideo)],
            kVideoFrames * 10);
  EXPECT_TRUE(log_stays.timestamps_increasing);
}

}  // namespace
}  // namespace aqueduct::tests::integration
