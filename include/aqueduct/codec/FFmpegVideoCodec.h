// Repository: Aqueduct
// Component: FFmpeg Video Codec
// Purpose: Lossless FFV1 intra-frame video codec over libavcodec.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_CODEC_FFMPEG_VIDEO_CODEC_H_
#define AQUEDUCT_CODEC_FFMPEG_VIDEO_CODEC_H_

#include <cstdint>
#include <vector>

#include "aqueduct/codec/ICodec.h"

// Forward declarations (FFmpeg headers are only included in the .cpp)
struct AVCodecContext;
struct AVFrame;
struct AVPacket;

namespace aqueduct::codec {

// FFmpegVideoCodec compresses BGRA and YV12 frames with FFV1, a lossless
// intra-only codec, so every compressed frame decodes on its own.
//
// Lifecycle:
// - Encoder and decoder contexts are opened lazily on the first frame and
//   reopened whenever width, height or pixel format change.
// - Other pixel formats report Supports() == false and travel uncompressed.
//
// Without FFmpeg the codec builds as a stub that supports no format.
class FFmpegVideoCodec : public ICodec {
 public:
  FFmpegVideoCodec();
  ~FFmpegVideoCodec() override;

  FFmpegVideoCodec(const FFmpegVideoCodec&) = delete;
  FFmpegVideoCodec& operator=(const FFmpegVideoCodec&) = delete;

  const char* Name() const override { return "ffv1"; }
  bool IsPassthrough() const override { return false; }
  bool Supports(media::PixelFormat format) const override;
  size_t MaxCompressedSize(const media::VideoDescriptor& desc) const override;

  CodecStatus Compress(const media::VideoDescriptor& desc,
                       const uint8_t* raw, size_t raw_size,
                       uint8_t* dst, size_t capacity,
                       size_t* written) override;

  CodecStatus Decompress(const media::VideoDescriptor& desc,
                         const uint8_t* compressed, size_t compressed_size,
                         uint8_t* dst, size_t capacity,
                         size_t* written) override;

 private:
  bool EnsureEncoder(const media::VideoDescriptor& desc);
  bool EnsureDecoder(const media::VideoDescriptor& desc);
  void CloseEncoder();
  void CloseDecoder();

  AVCodecContext* encoder_ctx_;
  AVCodecContext* decoder_ctx_;
  AVFrame* frame_;          // Encoder input (points at caller memory)
  AVFrame* decoded_frame_;  // Decoder output
  AVPacket* packet_;

  // Geometry the open contexts were configured for.
  uint32_t encoder_width_;
  uint32_t encoder_height_;
  media::PixelFormat encoder_format_;
  uint32_t decoder_width_;
  uint32_t decoder_height_;
  media::PixelFormat decoder_format_;

  int64_t frame_index_;

  // Padded copy of compressed input; capacity is retained across frames.
  std::vector<uint8_t> decode_scratch_;
};

}  // namespace aqueduct::codec

#endif  // AQUEDUCT_CODEC_FFMPEG_VIDEO_CODEC_H_
