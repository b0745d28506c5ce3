// Repository: Aqueduct
// Component: Codec Factory
// Purpose: Creates codec instances by kind.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_CODEC_CODEC_FACTORY_H_
#define AQUEDUCT_CODEC_CODEC_FACTORY_H_

#include <memory>
#include <string>

#include "aqueduct/codec/ICodec.h"

namespace aqueduct::codec {

enum class CodecKind {
  kPassthrough,
  kFFV1,
};

const char* CodecKindToString(CodecKind kind);

// Parses "none"/"passthrough" or "ffv1". Returns false on anything else.
bool ParseCodecKind(const std::string& value, CodecKind* kind);

// Returns a fresh codec instance. Codecs are stateful; create one per
// pipeline.
std::unique_ptr<ICodec> MakeCodec(CodecKind kind);

}  // namespace aqueduct::codec

#endif  // AQUEDUCT_CODEC_CODEC_FACTORY_H_
