// Repository: Aqueduct
// Component: Media Descriptors
// Purpose: Pixel formats and the fixed descriptors prefixed to video and audio payloads.
// Copyright (c) 2025 RetroVue

#include "aqueduct/media/MediaDescriptors.h"

#include "aqueduct/wire/ByteOrder.h"

namespace aqueduct::media {

using wire::LoadU32BE;
using wire::StoreU32BE;

namespace {

void StoreU16BE(uint8_t* dst, uint16_t value) {
  dst[0] = static_cast<uint8_t>(value >> 8);
  dst[1] = static_cast<uint8_t>(value);
}

uint16_t LoadU16BE(const uint8_t* src) {
  return static_cast<uint16_t>((static_cast<uint16_t>(src[0]) << 8) | src[1]);
}

}  // namespace

bool IsKnownPixelFormat(uint32_t raw) {
  return raw <= static_cast<uint32_t>(PixelFormat::kPA16);
}

const char* PixelFormatToString(PixelFormat format) {
  switch (format) {
    case PixelFormat::kUYVY:
      return "UYVY";
    case PixelFormat::kUYVA:
      return "UYVA";
    case PixelFormat::kBGRA:
      return "BGRA";
    case PixelFormat::kNV12:
      return "NV12";
    case PixelFormat::kYV12:
      return "YV12";
    case PixelFormat::kP216:
      return "P216";
    case PixelFormat::kPA16:
      return "PA16";
    default:
      return "unknown";
  }
}

size_t RawFrameSize(PixelFormat format, uint32_t width, uint32_t height) {
  const size_t w = width;
  const size_t h = height;
  const size_t luma = w * h;
  // Chroma is subsampled horizontally for 4:2:2 and in both axes for 4:2:0.
  const size_t chroma_422 = ((w + 1) / 2) * h;
  const size_t chroma_420 = ((w + 1) / 2) * ((h + 1) / 2);

  switch (format) {
    case PixelFormat::kUYVY:
      return (luma + 2 * chroma_422);
    case PixelFormat::kUYVA:
      return (luma + 2 * chroma_422) + luma;
    case PixelFormat::kBGRA:
      return luma * 4;
    case PixelFormat::kNV12:
    case PixelFormat::kYV12:
      return luma + 2 * chroma_420;
    case PixelFormat::kP216:
      return 2 * (luma + 2 * chroma_422);
    case PixelFormat::kPA16:
      return 2 * (luma + 2 * chroma_422) + 2 * luma;
    default:
      return 0;
  }
}

bool EncodeVideoDescriptor(const VideoDescriptor& desc, uint8_t* dst, size_t capacity) {
  if (dst == nullptr || capacity < kVideoDescriptorSize) {
    return false;
  }
  StoreU32BE(dst, desc.width);
  StoreU32BE(dst + 4, desc.height);
  StoreU16BE(dst + 8, static_cast<uint16_t>(desc.pixel_format));
  StoreU16BE(dst + 10, desc.frame_flags);
  StoreU32BE(dst + 12, desc.raw_size);
  return true;
}

bool DecodeVideoDescriptor(const uint8_t* src, size_t size, VideoDescriptor* desc) {
  if (src == nullptr || size < kVideoDescriptorSize) {
    return false;
  }
  const uint16_t raw_format = LoadU16BE(src + 8);
  if (!IsKnownPixelFormat(raw_format)) {
    return false;
  }
  if (desc) {
    desc->width = LoadU32BE(src);
    desc->height = LoadU32BE(src + 4);
    desc->pixel_format = static_cast<PixelFormat>(raw_format);
    desc->frame_flags = LoadU16BE(src + 10);
    desc->raw_size = LoadU32BE(src + 12);
  }
  return true;
}

bool EncodeAudioDescriptor(const AudioDescriptor& desc, uint8_t* dst, size_t capacity) {
  if (dst == nullptr || capacity < kAudioDescriptorSize) {
    return false;
  }
  StoreU32BE(dst, desc.sample_rate);
  StoreU32BE(dst + 4, desc.channels);
  StoreU32BE(dst + 8, desc.samples_per_channel);
  return true;
}

bool DecodeAudioDescriptor(const uint8_t* src, size_t size, AudioDescriptor* desc) {
  if (src == nullptr || size < kAudioDescriptorSize) {
    return false;
  }
  if (desc) {
    desc->sample_rate = LoadU32BE(src);
    desc->channels = LoadU32BE(src + 4);
    desc->samples_per_channel = LoadU32BE(src + 8);
  }
  return true;
}

}  // namespace aqueduct::media
