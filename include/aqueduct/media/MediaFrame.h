// Repository: Aqueduct
// Component: Media Frame
// Purpose: One unit of media content backed by pooled storage.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_MEDIA_MEDIA_FRAME_H_
#define AQUEDUCT_MEDIA_MEDIA_FRAME_H_

#include <cstddef>
#include <cstdint>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/media/MediaDescriptors.h"
#include "aqueduct/wire/PacketHeader.h"

namespace aqueduct::media {

// MediaFrame is a video image, an audio chunk, a metadata document or a
// control message, before compression (sender intake) or after
// decompression (receiver delivery).
//
// The bytes live in `storage` at [offset, offset + size). Capture sources
// leave kFrameHeadroom bytes free in front of the content so the sender can
// frame the payload without copying it.
struct MediaFrame {
  wire::PacketType type = wire::PacketType::kVideo;
  uint64_t timestamp_us = 0;  // Assigned by the sender clock on submit
  uint32_t flags = 0;         // wire::flags bits (kKeyFrame etc.)

  VideoDescriptor video;  // Valid when type == kVideo
  AudioDescriptor audio;  // Valid when type == kAudio

  buffer::PooledBuffer storage;
  size_t offset = 0;
  size_t size = 0;

  MediaFrame() = default;
  MediaFrame(MediaFrame&&) = default;
  MediaFrame& operator=(MediaFrame&&) = default;
  MediaFrame(const MediaFrame&) = delete;
  MediaFrame& operator=(const MediaFrame&) = delete;

  const uint8_t* data() const { return storage.valid() ? storage.data() + offset : nullptr; }
  uint8_t* mutable_data() { return storage.valid() ? storage.data() + offset : nullptr; }

  // Bytes free in front of the content.
  size_t headroom() const { return offset; }
};

}  // namespace aqueduct::media

#endif  // AQUEDUCT_MEDIA_MEDIA_FRAME_H_
