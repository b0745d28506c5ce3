// Repository: Aqueduct
// Component: Passthrough Codec
// Purpose: No-op codec that moves raw frames unchanged.
// Copyright (c) 2025 RetroVue

#include "aqueduct/codec/PassthroughCodec.h"

#include <cstring>

namespace aqueduct::codec {

const char* CodecStatusToString(CodecStatus status) {
  switch (status) {
    case CodecStatus::kOk:
      return "ok";
    case CodecStatus::kBufferTooSmall:
      return "buffer_too_small";
    case CodecStatus::kCodecError:
      return "codec_error";
    default:
      return "unknown";
  }
}

size_t PassthroughCodec::MaxCompressedSize(const media::VideoDescriptor& desc) const {
  return desc.raw_size;
}

CodecStatus PassthroughCodec::Compress(const media::VideoDescriptor& desc,
                                       const uint8_t* raw, size_t raw_size,
                                       uint8_t* dst, size_t capacity,
                                       size_t* written) {
  *written = 0;
  if (raw_size != desc.raw_size || (raw == nullptr && raw_size != 0)) {
    return CodecStatus::kCodecError;
  }
  if (capacity < raw_size) {
    return CodecStatus::kBufferTooSmall;
  }
  if (raw_size > 0 && dst != raw) {
    std::memmove(dst, raw, raw_size);
  }
  *written = raw_size;
  return CodecStatus::kOk;
}

CodecStatus PassthroughCodec::Decompress(const media::VideoDescriptor& desc,
                                         const uint8_t* compressed, size_t compressed_size,
                                         uint8_t* dst, size_t capacity,
                                         size_t* written) {
  *written = 0;
  if (compressed_size != desc.raw_size || (compressed == nullptr && compressed_size != 0)) {
    return CodecStatus::kCodecError;
  }
  if (capacity < compressed_size) {
    return CodecStatus::kBufferTooSmall;
  }
  if (compressed_size > 0 && dst != compressed) {
    std::memmove(dst, compressed, compressed_size);
  }
  *written = compressed_size;
  return CodecStatus::kOk;
}

}  // namespace aqueduct::codec
