// Repository: Aqueduct
// Component: Codec Factory
// Purpose: Creates codec instances by kind.
// Copyright (c) 2025 RetroVue

#include "aqueduct/codec/CodecFactory.h"

#include "aqueduct/codec/FFmpegVideoCodec.h"
#include "aqueduct/codec/PassthroughCodec.h"

namespace aqueduct::codec {

const char* CodecKindToString(CodecKind kind) {
  switch (kind) {
    case CodecKind::kPassthrough:
      return "none";
    case CodecKind::kFFV1:
      return "ffv1";
    default:
      return "unknown";
  }
}

bool ParseCodecKind(const std::string& value, CodecKind* kind) {
  if (value == "none" || value == "passthrough") {
    *kind = CodecKind::kPassthrough;
    return true;
  }
  if (value == "ffv1") {
    *kind = CodecKind::kFFV1;
    return true;
  }
  return false;
}

std::unique_ptr<ICodec> MakeCodec(CodecKind kind) {
  switch (kind) {
    case CodecKind::kFFV1:
      return std::make_unique<FFmpegVideoCodec>();
    case CodecKind::kPassthrough:
    default:
      return std::make_unique<PassthroughCodec>();
  }
}

}  // namespace aqueduct::codec
