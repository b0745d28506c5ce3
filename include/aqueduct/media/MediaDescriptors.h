// Repository: Aqueduct
// Component: Media Descriptors
// Purpose: Pixel formats and the fixed descriptors prefixed to video and audio payloads.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_MEDIA_MEDIA_DESCRIPTORS_H_
#define AQUEDUCT_MEDIA_MEDIA_DESCRIPTORS_H_

#include <cstddef>
#include <cstdint>

#include "aqueduct/wire/PacketHeader.h"

namespace aqueduct::media {

// Raw pixel layouts. Numeric values are the on-wire enumerants.
enum class PixelFormat : uint16_t {
  kUYVY = 0,  // 8-bit 4:2:2 packed
  kUYVA = 1,  // 8-bit 4:2:2 packed plus 8-bit alpha plane
  kBGRA = 2,  // 8-bit 4:4:4:4 packed
  kNV12 = 3,  // 8-bit 4:2:0, Y plane then interleaved UV
  kYV12 = 4,  // 8-bit 4:2:0, Y plane then V plane then U plane
  kP216 = 5,  // 16-bit 4:2:2, Y plane then interleaved UV
  kPA16 = 6,  // 16-bit 4:2:2, P216 plus 16-bit alpha plane
};

bool IsKnownPixelFormat(uint32_t raw);
const char* PixelFormatToString(PixelFormat format);

// Bytes occupied by one width x height frame in `format`.
// Returns 0 for zero dimensions.
size_t RawFrameSize(PixelFormat format, uint32_t width, uint32_t height);

// Video frame flag bits carried in VideoDescriptor::frame_flags.
namespace frame_flags {
constexpr uint16_t kAlpha = 0x1;
constexpr uint16_t kPremultiplied = 0x2;
constexpr uint16_t kHighBitDepth = 0x4;
}  // namespace frame_flags

// VideoDescriptor prefixes every Video payload (16 bytes, big-endian):
//   width:u32 | height:u32 | pixel_format:u16 | frame_flags:u16 | raw_size:u32
// raw_size is the uncompressed frame size, which is what a decompressor
// must produce.
struct VideoDescriptor {
  uint32_t width = 0;
  uint32_t height = 0;
  PixelFormat pixel_format = PixelFormat::kBGRA;
  uint16_t frame_flags = 0;
  uint32_t raw_size = 0;
};

constexpr size_t kVideoDescriptorSize = 16;

// AudioDescriptor prefixes every Audio payload (12 bytes, big-endian):
//   sample_rate:u32 | channels:u32 | samples_per_channel:u32
// Samples that follow are 32-bit float, little-endian, interleaved.
struct AudioDescriptor {
  uint32_t sample_rate = 0;
  uint32_t channels = 0;
  uint32_t samples_per_channel = 0;

  size_t SampleBytes() const {
    return static_cast<size_t>(channels) * samples_per_channel * sizeof(float);
  }
};

constexpr size_t kAudioDescriptorSize = 12;

// Room reserved ahead of media bytes so the sender can frame a payload in
// place: packet header plus the largest descriptor.
constexpr size_t kFrameHeadroom = wire::kHeaderSize + kVideoDescriptorSize;

// Descriptor codecs. Encoders return false if `capacity` is too small.
// Decoders return false on short input or an unknown pixel format.
bool EncodeVideoDescriptor(const VideoDescriptor& desc, uint8_t* dst, size_t capacity);
bool DecodeVideoDescriptor(const uint8_t* src, size_t size, VideoDescriptor* desc);
bool EncodeAudioDescriptor(const AudioDescriptor& desc, uint8_t* dst, size_t capacity);
bool DecodeAudioDescriptor(const uint8_t* src, size_t size, AudioDescriptor* desc);

}  // namespace aqueduct::media

#endif  // AQUEDUCT_MEDIA_MEDIA_DESCRIPTORS_H_
