// Repository: Aqueduct
// Component: Synthetic Source
// Purpose: Paced test-pattern video, sine-tone audio and tally metadata.
// Copyright (c) 2025 RetroVue

#include "aqueduct/capture/SyntheticSource.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>

#include "aqueduct/media/MediaDescriptors.h"

namespace aqueduct::capture {

namespace {

// SMPTE-style bars in BGRA order: white, yellow, cyan, green, magenta,
// red, blue, black.
constexpr uint8_t kBars[8][4] = {
    {235, 235, 235, 255}, {16, 235, 235, 255}, {235, 235, 16, 255}, {16, 235, 16, 255},
    {235, 16, 235, 255},  {16, 16, 235, 255},  {235, 16, 16, 255},  {16, 16, 16, 255},
};

// Pixels the pattern scrolls per frame so receivers can see motion.
constexpr uint32_t kScrollPixelsPerFrame = 4;

}  // namespace

SyntheticSource::SyntheticSource(const SyntheticSourceConfig& config,
                                 std::shared_ptr<buffer::BufferPool> pool,
                                 std::shared_ptr<timing::MasterClock> clock)
    : config_(config),
      pool_(std::move(pool)),
      clock_(clock ? std::move(clock) : timing::MakeSystemMasterClock()),
      tone_(config.tone_hz, config.sample_rate, config.channels),
      stop_requested_(false),
      next_step_(Step::kVideo),
      video_frames_(0),
      frame_interval_us_(static_cast<int64_t>(
          std::max(1.0, std::round(1'000'000.0 / std::max(config.target_fps, 0.001))))),
      next_deadline_utc_us_(0) {}

void SyntheticSource::Stop() {
  stop_requested_.store(true, std::memory_order_release);
}

bool SyntheticSource::Next(media::MediaFrame& frame) {
  if (stop_requested_.load(std::memory_order_acquire) || !pool_) {
    return false;
  }

  switch (next_step_) {
    case Step::kVideo: {
      if (config_.max_frames > 0 && video_frames_ >= config_.max_frames) {
        return false;
      }
      WaitForDeadline();
      if (stop_requested_.load(std::memory_order_acquire)) {
        return false;
      }
      if (!ProduceVideo(frame)) {
        return false;
      }
      const bool metadata_due = config_.metadata_interval_frames > 0 &&
                                (video_frames_ - 1) % config_.metadata_interval_frames == 0;
      if (config_.audio_enabled) {
        next_step_ = Step::kAudio;
      } else if (metadata_due) {
        next_step_ = Step::kMetadata;
      }
      return true;
    }

    case Step::kAudio: {
      const bool metadata_due = config_.metadata_interval_frames > 0 &&
                                (video_frames_ - 1) % config_.metadata_interval_frames == 0;
      next_step_ = metadata_due ? Step::kMetadata : Step::kVideo;
      return ProduceAudio(frame);
    }

    case Step::kMetadata:
    default:
      next_step_ = Step::kVideo;
      return ProduceMetadata(frame);
  }
}

void SyntheticSource::WaitForDeadline() {
  if (!config_.paced) {
    return;
  }
  const int64_t now = clock_->now_utc_us();
  if (next_deadline_utc_us_ == 0 || now - next_deadline_utc_us_ > frame_interval_us_) {
    // First frame, or too far behind to catch up without a burst.
    next_deadline_utc_us_ = now;
  }
  clock_->WaitUntilUtcUs(next_deadline_utc_us_);
  next_deadline_utc_us_ += frame_interval_us_;
}

bool SyntheticSource::ProduceVideo(media::MediaFrame& frame) {
  media::VideoDescriptor desc;
  desc.width = config_.width;
  desc.height = config_.height;
  desc.pixel_format = media::PixelFormat::kBGRA;
  desc.frame_flags = 0;
  desc.raw_size = static_cast<uint32_t>(
      media::RawFrameSize(desc.pixel_format, desc.width, desc.height));
  if (desc.raw_size == 0) {
    std::cerr << "[SyntheticSource] Invalid geometry " << config_.width << "x"
              << config_.height << std::endl;
    return false;
  }

  buffer::PooledBuffer storage = pool_->Acquire(media::kFrameHeadroom + desc.raw_size);
  if (!storage.valid()) {
    std::cerr << "[SyntheticSource] Pool refused a " << desc.raw_size << "-byte frame"
              << std::endl;
    return false;
  }
  storage.set_size(media::kFrameHeadroom + desc.raw_size);
  FillTestPattern(storage.data() + media::kFrameHeadroom, video_frames_);

  frame.type = wire::PacketType::kVideo;
  frame.flags = wire::flags::kKeyFrame;
  frame.video = desc;
  frame.storage = std::move(storage);
  frame.offset = media::kFrameHeadroom;
  frame.size = desc.raw_size;

  video_frames_++;
  return true;
}

bool SyntheticSource::ProduceAudio(media::MediaFrame& frame) {
  media::AudioDescriptor desc;
  desc.sample_rate = config_.sample_rate;
  desc.channels = config_.channels;
  desc.samples_per_channel = config_.samples_per_frame;

  const size_t bytes = tone_.BytesFor(desc.samples_per_channel);
  buffer::PooledBuffer storage = pool_->Acquire(media::kFrameHeadroom + bytes);
  if (!storage.valid()) {
    std::cerr << "[SyntheticSource] Pool refused a " << bytes << "-byte audio chunk"
              << std::endl;
    return false;
  }
  const size_t written = tone_.Generate(desc.samples_per_channel,
                                        storage.data() + media::kFrameHeadroom,
                                        storage.capacity() - media::kFrameHeadroom);
  if (written != bytes) {
    std::cerr << "[SyntheticSource] Tone generation failed" << std::endl;
    return false;
  }
  storage.set_size(media::kFrameHeadroom + bytes);

  frame.type = wire::PacketType::kAudio;
  frame.flags = 0;
  frame.audio = desc;
  frame.storage = std::move(storage);
  frame.offset = media::kFrameHeadroom;
  frame.size = bytes;
  return true;
}

bool SyntheticSource::ProduceMetadata(media::MediaFrame& frame) {
  const std::string xml = "<tally><on_program>true</on_program><source>" + config_.label +
                          "</source></tally>";

  buffer::PooledBuffer storage = pool_->Acquire(media::kFrameHeadroom + xml.size());
  if (!storage.valid()) {
    std::cerr << "[SyntheticSource] Pool refused a metadata buffer" << std::endl;
    return false;
  }
  std::memcpy(storage.data() + media::kFrameHeadroom, xml.data(), xml.size());
  storage.set_size(media::kFrameHeadroom + xml.size());

  frame.type = wire::PacketType::kMetadata;
  frame.flags = 0;
  frame.storage = std::move(storage);
  frame.offset = media::kFrameHeadroom;
  frame.size = xml.size();
  return true;
}

void SyntheticSource::FillTestPattern(uint8_t* bgra, uint64_t frame_index) const {
  const uint32_t width = config_.width;
  const uint32_t height = config_.height;
  const uint64_t scroll = frame_index * kScrollPixelsPerFrame;

  // Build one row, then replicate it.
  for (uint32_t x = 0; x < width; ++x) {
    const uint64_t bar = ((x + scroll) * 8 / width) % 8;
    std::memcpy(bgra + static_cast<size_t>(x) * 4, kBars[bar], 4);
  }
  const size_t row_bytes = static_cast<size_t>(width) * 4;
  for (uint32_t y = 1; y < height; ++y) {
    std::memcpy(bgra + static_cast<size_t>(y) * row_bytes, bgra, row_bytes);
  }
}

}  // namespace aqueduct::capture
