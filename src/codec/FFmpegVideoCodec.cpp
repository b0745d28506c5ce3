// Repository: Aqueduct
// Component: FFmpeg Video Codec
// Purpose: Lossless FFV1 intra-frame video codec over libavcodec.
// Copyright (c) 2025 RetroVue

#include "aqueduct/codec/FFmpegVideoCodec.h"

#include <cstring>
#include <iostream>
#include <string>

#ifdef AQUEDUCT_FFMPEG_AVAILABLE
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libavutil/log.h>
}
#endif

namespace aqueduct::codec {

#ifdef AQUEDUCT_FFMPEG_AVAILABLE

namespace {

// Slack for bitstream headers on incompressible input.
constexpr size_t kCompressedSlackBytes = 64 * 1024;

AVPixelFormat ToAVPixelFormat(media::PixelFormat format) {
  switch (format) {
    case media::PixelFormat::kBGRA:
      return AV_PIX_FMT_BGRA;
    case media::PixelFormat::kYV12:
      return AV_PIX_FMT_YUV420P;
    default:
      return AV_PIX_FMT_NONE;
  }
}

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return std::string(errbuf);
}

// Fills plane pointers for a tightly packed raw frame. YV12 stores V before
// U, so the chroma planes are swapped relative to YUV420P.
void FillPlanes(media::PixelFormat format, uint32_t width, uint32_t height,
                uint8_t* base, uint8_t* data[4], int linesize[4]) {
  for (int i = 0; i < 4; ++i) {
    data[i] = nullptr;
    linesize[i] = 0;
  }
  if (format == media::PixelFormat::kBGRA) {
    data[0] = base;
    linesize[0] = static_cast<int>(width) * 4;
    return;
  }
  const size_t luma = static_cast<size_t>(width) * height;
  const uint32_t chroma_w = (width + 1) / 2;
  const uint32_t chroma_h = (height + 1) / 2;
  const size_t chroma = static_cast<size_t>(chroma_w) * chroma_h;
  data[0] = base;
  data[2] = base + luma;           // V
  data[1] = base + luma + chroma;  // U
  linesize[0] = static_cast<int>(width);
  linesize[1] = static_cast<int>(chroma_w);
  linesize[2] = static_cast<int>(chroma_w);
}

bool ValidateFrame(const media::VideoDescriptor& desc, size_t raw_size) {
  if (desc.width == 0 || desc.height == 0) {
    return false;
  }
  return raw_size == media::RawFrameSize(desc.pixel_format, desc.width, desc.height);
}

}  // namespace

FFmpegVideoCodec::FFmpegVideoCodec()
    : encoder_ctx_(nullptr),
      decoder_ctx_(nullptr),
      frame_(nullptr),
      decoded_frame_(nullptr),
      packet_(nullptr),
      encoder_width_(0),
      encoder_height_(0),
      encoder_format_(media::PixelFormat::kBGRA),
      decoder_width_(0),
      decoder_height_(0),
      decoder_format_(media::PixelFormat::kBGRA),
      frame_index_(0) {
  // Keep errors visible, suppress informational chatter.
  av_log_set_level(AV_LOG_ERROR);
  frame_ = av_frame_alloc();
  decoded_frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
}

FFmpegVideoCodec::~FFmpegVideoCodec() {
  CloseEncoder();
  CloseDecoder();
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (decoded_frame_) {
    av_frame_free(&decoded_frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
}

bool FFmpegVideoCodec::Supports(media::PixelFormat format) const {
  return ToAVPixelFormat(format) != AV_PIX_FMT_NONE;
}

size_t FFmpegVideoCodec::MaxCompressedSize(const media::VideoDescriptor& desc) const {
  return static_cast<size_t>(desc.raw_size) * 2 + kCompressedSlackBytes;
}

void FFmpegVideoCodec::CloseEncoder() {
  if (encoder_ctx_) {
    avcodec_free_context(&encoder_ctx_);
  }
  encoder_width_ = 0;
  encoder_height_ = 0;
}

void FFmpegVideoCodec::CloseDecoder() {
  if (decoder_ctx_) {
    avcodec_free_context(&decoder_ctx_);
  }
  decoder_width_ = 0;
  decoder_height_ = 0;
}

bool FFmpegVideoCodec::EnsureEncoder(const media::VideoDescriptor& desc) {
  if (encoder_ctx_ && encoder_width_ == desc.width && encoder_height_ == desc.height &&
      encoder_format_ == desc.pixel_format) {
    return true;
  }

  // First frame or geometry changed: reopen.
  CloseEncoder();

  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_FFV1);
  if (!codec) {
    std::cerr << "[FFmpegVideoCodec] FFV1 encoder not found" << std::endl;
    return false;
  }

  encoder_ctx_ = avcodec_alloc_context3(codec);
  if (!encoder_ctx_) {
    std::cerr << "[FFmpegVideoCodec] Failed to allocate encoder context" << std::endl;
    return false;
  }

  encoder_ctx_->width = static_cast<int>(desc.width);
  encoder_ctx_->height = static_cast<int>(desc.height);
  encoder_ctx_->pix_fmt = ToAVPixelFormat(desc.pixel_format);
  encoder_ctx_->time_base = AVRational{1, 1'000'000};
  // Every frame is a keyframe so any packet decodes on its own.
  encoder_ctx_->gop_size = 1;

  int ret = avcodec_open2(encoder_ctx_, codec, nullptr);
  if (ret < 0) {
    std::cerr << "[FFmpegVideoCodec] Failed to open encoder: " << AvError(ret) << std::endl;
    CloseEncoder();
    return false;
  }

  encoder_width_ = desc.width;
  encoder_height_ = desc.height;
  encoder_format_ = desc.pixel_format;
  frame_index_ = 0;
  std::cout << "[FFmpegVideoCodec] Encoder opened: " << desc.width << "x" << desc.height
            << " " << media::PixelFormatToString(desc.pixel_format) << std::endl;
  return true;
}

bool FFmpegVideoCodec::EnsureDecoder(const media::VideoDescriptor& desc) {
  if (decoder_ctx_ && decoder_width_ == desc.width && decoder_height_ == desc.height &&
      decoder_format_ == desc.pixel_format) {
    return true;
  }

  CloseDecoder();

  const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_FFV1);
  if (!codec) {
    std::cerr << "[FFmpegVideoCodec] FFV1 decoder not found" << std::endl;
    return false;
  }

  decoder_ctx_ = avcodec_alloc_context3(codec);
  if (!decoder_ctx_) {
    std::cerr << "[FFmpegVideoCodec] Failed to allocate decoder context" << std::endl;
    return false;
  }
  decoder_ctx_->width = static_cast<int>(desc.width);
  decoder_ctx_->height = static_cast<int>(desc.height);

  int ret = avcodec_open2(decoder_ctx_, codec, nullptr);
  if (ret < 0) {
    std::cerr << "[FFmpegVideoCodec] Failed to open decoder: " << AvError(ret) << std::endl;
    CloseDecoder();
    return false;
  }

  decoder_width_ = desc.width;
  decoder_height_ = desc.height;
  decoder_format_ = desc.pixel_format;
  return true;
}

CodecStatus FFmpegVideoCodec::Compress(const media::VideoDescriptor& desc,
                                       const uint8_t* raw, size_t raw_size,
                                       uint8_t* dst, size_t capacity,
                                       size_t* written) {
  *written = 0;
  if (!Supports(desc.pixel_format) || raw == nullptr || !ValidateFrame(desc, raw_size)) {
    return CodecStatus::kCodecError;
  }
  if (!frame_ || !packet_ || !EnsureEncoder(desc)) {
    return CodecStatus::kCodecError;
  }

  // The encoder copies non-refcounted input, so pointing at caller memory is safe.
  av_frame_unref(frame_);
  frame_->format = encoder_ctx_->pix_fmt;
  frame_->width = encoder_ctx_->width;
  frame_->height = encoder_ctx_->height;
  frame_->pts = frame_index_++;
  FillPlanes(desc.pixel_format, desc.width, desc.height, const_cast<uint8_t*>(raw),
             frame_->data, frame_->linesize);

  int ret = avcodec_send_frame(encoder_ctx_, frame_);
  if (ret < 0) {
    std::cerr << "[FFmpegVideoCodec] avcodec_send_frame failed: " << AvError(ret) << std::endl;
    return CodecStatus::kCodecError;
  }

  ret = avcodec_receive_packet(encoder_ctx_, packet_);
  if (ret < 0) {
    std::cerr << "[FFmpegVideoCodec] avcodec_receive_packet failed: " << AvError(ret)
              << std::endl;
    return CodecStatus::kCodecError;
  }

  CodecStatus status = CodecStatus::kOk;
  const size_t size = static_cast<size_t>(packet_->size);
  if (size > capacity) {
    status = CodecStatus::kBufferTooSmall;
  } else {
    std::memcpy(dst, packet_->data, size);
    *written = size;
  }
  av_packet_unref(packet_);
  return status;
}

CodecStatus FFmpegVideoCodec::Decompress(const media::VideoDescriptor& desc,
                                         const uint8_t* compressed, size_t compressed_size,
                                         uint8_t* dst, size_t capacity,
                                         size_t* written) {
  *written = 0;
  if (!Supports(desc.pixel_format) || compressed == nullptr || compressed_size == 0) {
    return CodecStatus::kCodecError;
  }
  if (desc.width == 0 || desc.height == 0 ||
      desc.raw_size != media::RawFrameSize(desc.pixel_format, desc.width, desc.height)) {
    return CodecStatus::kCodecError;
  }
  if (capacity < desc.raw_size) {
    return CodecStatus::kBufferTooSmall;
  }
  if (!decoded_frame_ || !packet_ || !EnsureDecoder(desc)) {
    return CodecStatus::kCodecError;
  }

  // libavcodec may over-read input by up to AV_INPUT_BUFFER_PADDING_SIZE bytes.
  decode_scratch_.resize(compressed_size + AV_INPUT_BUFFER_PADDING_SIZE);
  std::memcpy(decode_scratch_.data(), compressed, compressed_size);
  std::memset(decode_scratch_.data() + compressed_size, 0, AV_INPUT_BUFFER_PADDING_SIZE);

  av_packet_unref(packet_);
  packet_->data = decode_scratch_.data();
  packet_->size = static_cast<int>(compressed_size);

  int ret = avcodec_send_packet(decoder_ctx_, packet_);
  packet_->data = nullptr;
  packet_->size = 0;
  if (ret < 0) {
    std::cerr << "[FFmpegVideoCodec] avcodec_send_packet failed: " << AvError(ret) << std::endl;
    // A rejected bitstream can leave the decoder in a bad state; start fresh next frame.
    CloseDecoder();
    return CodecStatus::kCodecError;
  }

  ret = avcodec_receive_frame(decoder_ctx_, decoded_frame_);
  if (ret < 0) {
    std::cerr << "[FFmpegVideoCodec] avcodec_receive_frame failed: " << AvError(ret)
              << std::endl;
    CloseDecoder();
    return CodecStatus::kCodecError;
  }

  const AVPixelFormat expected = ToAVPixelFormat(desc.pixel_format);
  const bool format_ok = decoded_frame_->format == expected ||
                         (expected == AV_PIX_FMT_BGRA && decoded_frame_->format == AV_PIX_FMT_BGR0);
  if (!format_ok || decoded_frame_->width != static_cast<int>(desc.width) ||
      decoded_frame_->height != static_cast<int>(desc.height)) {
    std::cerr << "[FFmpegVideoCodec] Decoded frame does not match descriptor | "
              << decoded_frame_->width << "x" << decoded_frame_->height << " vs "
              << desc.width << "x" << desc.height << std::endl;
    av_frame_unref(decoded_frame_);
    return CodecStatus::kCodecError;
  }

  // Copy planes out in the wire layout (V before U for YV12).
  uint8_t* planes[4];
  int linesizes[4];
  FillPlanes(desc.pixel_format, desc.width, desc.height, dst, planes, linesizes);
  const uint8_t* src_planes[4] = {decoded_frame_->data[0], decoded_frame_->data[1],
                                  decoded_frame_->data[2], nullptr};
  const int height = static_cast<int>(desc.height);
  const int chroma_height = (height + 1) / 2;
  const int plane_count = desc.pixel_format == media::PixelFormat::kBGRA ? 1 : 3;
  for (int plane = 0; plane < plane_count; ++plane) {
    av_image_copy_plane(planes[plane], linesizes[plane],
                        src_planes[plane], decoded_frame_->linesize[plane],
                        linesizes[plane], plane == 0 ? height : chroma_height);
  }
  av_frame_unref(decoded_frame_);

  *written = desc.raw_size;
  return CodecStatus::kOk;
}

#else
// Stub implementations when FFmpeg is not available

FFmpegVideoCodec::FFmpegVideoCodec()
    : encoder_ctx_(nullptr),
      decoder_ctx_(nullptr),
      frame_(nullptr),
      decoded_frame_(nullptr),
      packet_(nullptr),
      encoder_width_(0),
      encoder_height_(0),
      encoder_format_(media::PixelFormat::kBGRA),
      decoder_width_(0),
      decoder_height_(0),
      decoder_format_(media::PixelFormat::kBGRA),
      frame_index_(0) {
  std::cerr << "[FFmpegVideoCodec] ERROR: FFmpeg not available. Rebuild with FFmpeg to "
               "enable compression; frames will be sent uncompressed." << std::endl;
}

FFmpegVideoCodec::~FFmpegVideoCodec() = default;

bool FFmpegVideoCodec::Supports(media::PixelFormat) const {
  return false;
}

size_t FFmpegVideoCodec::MaxCompressedSize(const media::VideoDescriptor& desc) const {
  return desc.raw_size;
}

CodecStatus FFmpegVideoCodec::Compress(const media::VideoDescriptor&, const uint8_t*, size_t,
                                       uint8_t*, size_t, size_t* written) {
  *written = 0;
  return CodecStatus::kCodecError;
}

CodecStatus FFmpegVideoCodec::Decompress(const media::VideoDescriptor&, const uint8_t*, size_t,
                                         uint8_t*, size_t, size_t* written) {
  *written = 0;
  return CodecStatus::kCodecError;
}

bool FFmpegVideoCodec::EnsureEncoder(const media::VideoDescriptor&) { return false; }
bool FFmpegVideoCodec::EnsureDecoder(const media::VideoDescriptor&) { return false; }
void FFmpegVideoCodec::CloseEncoder() {}
void FFmpegVideoCodec::CloseDecoder() {}

#endif  // AQUEDUCT_FFMPEG_AVAILABLE

}  // namespace aqueduct::codec
