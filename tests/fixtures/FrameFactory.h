// Repository: Aqueduct
// Component: Frame Factory for Testing
// Purpose: Generate synthetic media frames and raw wire bytes for testing.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_TESTS_FIXTURES_FRAME_FACTORY_H_
#define AQUEDUCT_TESTS_FIXTURES_FRAME_FACTORY_H_

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/media/MediaDescriptors.h"
#include "aqueduct/media/MediaFrame.h"
#include "aqueduct/wire/ByteOrder.h"
#include "aqueduct/wire/PacketCodec.h"

namespace aqueduct::tests::fixtures {

// FrameFactory builds frames the way a capture source would: content placed
// after media::kFrameHeadroom bytes of the pooled block.
class FrameFactory {
 public:
  explicit FrameFactory(std::shared_ptr<buffer::BufferPool> pool) : pool_(std::move(pool)) {}

  // BGRA frame whose bytes are (seed + i) & 0xFF.
  media::MediaFrame CreateVideo(uint32_t width, uint32_t height, uint8_t seed = 0,
                                bool key_frame = true) {
    media::MediaFrame frame;
    frame.type = wire::PacketType::kVideo;
    frame.flags = key_frame ? wire::flags::kKeyFrame : 0;
    frame.video.width = width;
    frame.video.height = height;
    frame.video.pixel_format = media::PixelFormat::kBGRA;
    frame.video.raw_size =
        static_cast<uint32_t>(media::RawFrameSize(media::PixelFormat::kBGRA, width, height));

    Allocate(frame, frame.video.raw_size);
    uint8_t* bytes = frame.mutable_data();
    for (size_t i = 0; i < frame.size; ++i) {
      bytes[i] = static_cast<uint8_t>((seed + i) & 0xFF);
    }
    return frame;
  }

  // Interleaved float audio, sample k of channel c = k + c / 10.
  media::MediaFrame CreateAudio(uint32_t samples_per_channel, uint32_t channels = 2,
                                uint32_t sample_rate = 48000) {
    media::MediaFrame frame;
    frame.type = wire::PacketType::kAudio;
    frame.audio.sample_rate = sample_rate;
    frame.audio.channels = channels;
    frame.audio.samples_per_channel = samples_per_channel;

    Allocate(frame, frame.audio.SampleBytes());
    float* samples = reinterpret_cast<float*>(frame.mutable_data());
    for (uint32_t k = 0; k < samples_per_channel; ++k) {
      for (uint32_t c = 0; c < channels; ++c) {
        samples[k * channels + c] = static_cast<float>(k) + static_cast<float>(c) / 10.0f;
      }
    }
    return frame;
  }

  media::MediaFrame CreateMetadata(const std::string& xml) {
    media::MediaFrame frame;
    frame.type = wire::PacketType::kMetadata;
    Allocate(frame, xml.size());
    std::memcpy(frame.mutable_data(), xml.data(), xml.size());
    return frame;
  }

  // Frame with no headroom, forcing the sender to copy.
  media::MediaFrame CreateTightVideo(uint32_t width, uint32_t height) {
    media::MediaFrame frame = CreateVideo(width, height);
    media::MediaFrame tight;
    tight.type = frame.type;
    tight.flags = frame.flags;
    tight.video = frame.video;
    tight.storage = pool_->Acquire(frame.size);
    tight.storage.set_size(frame.size);
    tight.offset = 0;
    tight.size = frame.size;
    std::memcpy(tight.mutable_data(), frame.data(), frame.size);
    return tight;
  }

 private:
  void Allocate(media::MediaFrame& frame, size_t content_size) {
    frame.storage = pool_->Acquire(media::kFrameHeadroom + content_size);
    frame.storage.set_size(media::kFrameHeadroom + content_size);
    frame.offset = media::kFrameHeadroom;
    frame.size = content_size;
  }

  std::shared_ptr<buffer::BufferPool> pool_;
};

// Raw header bytes, bypassing the codec's validation (for malformed input).
inline std::vector<uint8_t> RawHeader(uint32_t length, uint32_t type, uint64_t timestamp_us,
                                      uint32_t flags) {
  std::vector<uint8_t> bytes(wire::kHeaderSize);
  wire::StoreU32BE(bytes.data(), length);
  wire::StoreU32BE(bytes.data() + 4, type);
  wire::StoreU64BE(bytes.data() + 8, timestamp_us);
  wire::StoreU32BE(bytes.data() + 16, flags);
  return bytes;
}

// Header plus payload, as a sender would put them on the wire.
inline std::vector<uint8_t> EncodePacketBytes(wire::PacketType type, uint64_t timestamp_us,
                                              uint32_t flags,
                                              const std::vector<uint8_t>& payload) {
  wire::PacketHeader header;
  header.length = static_cast<uint32_t>(payload.size());
  header.type = type;
  header.timestamp_us = timestamp_us;
  header.flags = flags;

  std::vector<uint8_t> bytes(wire::EncodedSize(header));
  size_t written = 0;
  wire::EncodeInto(header, payload.data(), payload.size(), bytes.data(), bytes.size(),
                   &written);
  bytes.resize(written);
  return bytes;
}

// Video payload: descriptor then raw BGRA bytes.
inline std::vector<uint8_t> VideoPayload(uint32_t width, uint32_t height, uint8_t fill) {
  media::VideoDescriptor desc;
  desc.width = width;
  desc.height = height;
  desc.pixel_format = media::PixelFormat::kBGRA;
  desc.raw_size =
      static_cast<uint32_t>(media::RawFrameSize(media::PixelFormat::kBGRA, width, height));

  std::vector<uint8_t> payload(media::kVideoDescriptorSize + desc.raw_size, fill);
  media::EncodeVideoDescriptor(desc, payload.data(), payload.size());
  return payload;
}

}  // namespace aqueduct::tests::fixtures

#endif  // AQUEDUCT_TESTS_FIXTURES_FRAME_FACTORY_H_
