// Repository: Aqueduct
// Component: Passthrough Codec
// Purpose: No-op codec that moves raw frames unchanged.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_CODEC_PASSTHROUGH_CODEC_H_
#define AQUEDUCT_CODEC_PASSTHROUGH_CODEC_H_

#include "aqueduct/codec/ICodec.h"

namespace aqueduct::codec {

class PassthroughCodec : public ICodec {
 public:
  const char* Name() const override { return "passthrough"; }
  bool IsPassthrough() const override { return true; }
  bool Supports(media::PixelFormat) const override { return true; }
  size_t MaxCompressedSize(const media::VideoDescriptor& desc) const override;

  CodecStatus Compress(const media::VideoDescriptor& desc,
                       const uint8_t* raw, size_t raw_size,
                       uint8_t* dst, size_t capacity,
                       size_t* written) override;

  CodecStatus Decompress(const media::VideoDescriptor& desc,
                         const uint8_t* compressed, size_t compressed_size,
                         uint8_t* dst, size_t capacity,
                         size_t* written) override;
};

}  // namespace aqueduct::codec

#endif  // AQUEDUCT_CODEC_PASSTHROUGH_CODEC_H_
