// Repository: Aqueduct
// Component: Sine Wave Generator
// Purpose: Continuous-phase test tone as interleaved 32-bit float samples.
// Copyright (c) 2025 RetroVue

#include "aqueduct/capture/SineWaveGenerator.h"

#include <cmath>
#include <cstring>

namespace aqueduct::capture {

namespace {

constexpr float kTwoPi = 6.28318530717958647692f;

void StoreF32LE(float value, uint8_t* dst) {
  uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  dst[0] = static_cast<uint8_t>(bits);
  dst[1] = static_cast<uint8_t>(bits >> 8);
  dst[2] = static_cast<uint8_t>(bits >> 16);
  dst[3] = static_cast<uint8_t>(bits >> 24);
}

}  // namespace

SineWaveGenerator::SineWaveGenerator(float frequency_hz, uint32_t sample_rate, uint32_t channels)
    : frequency_hz_(frequency_hz),
      sample_rate_(sample_rate),
      channels_(channels),
      phase_(0.0f) {}

size_t SineWaveGenerator::BytesFor(size_t samples_per_channel) const {
  return samples_per_channel * channels_ * sizeof(float);
}

size_t SineWaveGenerator::Generate(size_t samples_per_channel, uint8_t* dst, size_t capacity) {
  const size_t needed = BytesFor(samples_per_channel);
  if (dst == nullptr || capacity < needed || sample_rate_ == 0) {
    return 0;
  }

  const float increment = frequency_hz_ * kTwoPi / static_cast<float>(sample_rate_);
  uint8_t* out = dst;
  for (size_t i = 0; i < samples_per_channel; ++i) {
    const float sample = std::sin(phase_);
    phase_ = std::fmod(phase_ + increment, kTwoPi);
    for (uint32_t c = 0; c < channels_; ++c) {
      StoreF32LE(sample, out);
      out += sizeof(float);
    }
  }
  return needed;
}

}  // namespace aqueduct::capture
