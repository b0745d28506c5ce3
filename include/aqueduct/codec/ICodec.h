// Repository: Aqueduct
// Component: Codec Interface
// Purpose: Pluggable compress/decompress capability for video payloads.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_CODEC_I_CODEC_H_
#define AQUEDUCT_CODEC_I_CODEC_H_

#include <cstddef>
#include <cstdint>

#include "aqueduct/media/MediaDescriptors.h"

namespace aqueduct::codec {

enum class CodecStatus {
  kOk = 0,
  kBufferTooSmall,  // Destination capacity insufficient
  kCodecError,      // Malformed input or codec failure; fatal for this frame only
};

const char* CodecStatusToString(CodecStatus status);

// ICodec compresses raw video frames into caller-supplied memory and back.
//
// Contract:
// - Compress/Decompress never allocate the destination; the caller sizes it
//   with MaxCompressedSize() or the descriptor's raw_size.
// - Failure affects only the frame being processed.
// - Instances are stateful and not thread-safe: one per pipeline (the
//   sender intake, or one receiver connection).
class ICodec {
 public:
  virtual ~ICodec() = default;

  virtual const char* Name() const = 0;

  // True if Compress() is a plain copy. The sender then skips compression
  // and frames raw bytes in place.
  virtual bool IsPassthrough() const = 0;

  // True if frames in `format` can be compressed. Frames in other formats
  // are sent uncompressed.
  virtual bool Supports(media::PixelFormat format) const = 0;

  // Upper bound on Compress() output for a frame described by `desc`.
  virtual size_t MaxCompressedSize(const media::VideoDescriptor& desc) const = 0;

  virtual CodecStatus Compress(const media::VideoDescriptor& desc,
                               const uint8_t* raw, size_t raw_size,
                               uint8_t* dst, size_t capacity,
                               size_t* written) = 0;

  // Produces exactly desc.raw_size bytes or fails with kCodecError.
  virtual CodecStatus Decompress(const media::VideoDescriptor& desc,
                                 const uint8_t* compressed, size_t compressed_size,
                                 uint8_t* dst, size_t capacity,
                                 size_t* written) = 0;
};

}  // namespace aqueduct::codec

#endif  // AQUEDUCT_CODEC_I_CODEC_H_
