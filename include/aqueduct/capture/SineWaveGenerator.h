// Repository: Aqueduct
// Component: Sine Wave Generator
// Purpose: Continuous-phase test tone as interleaved 32-bit float samples.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_CAPTURE_SINE_WAVE_GENERATOR_H_
#define AQUEDUCT_CAPTURE_SINE_WAVE_GENERATOR_H_

#include <cstddef>
#include <cstdint>

namespace aqueduct::capture {

// SineWaveGenerator produces a tone whose phase carries over between
// calls, so consecutive chunks join without a click. Every channel carries
// the same sample.
class SineWaveGenerator {
 public:
  explicit SineWaveGenerator(float frequency_hz = 440.0f, uint32_t sample_rate = 48000,
                             uint32_t channels = 2);

  // Bytes Generate() writes for `samples_per_channel` samples.
  size_t BytesFor(size_t samples_per_channel) const;

  // Writes `samples_per_channel` interleaved float samples (little-endian)
  // into `dst`. Returns bytes written, or 0 if `capacity` is too small.
  size_t Generate(size_t samples_per_channel, uint8_t* dst, size_t capacity);

  float frequency_hz() const { return frequency_hz_; }
  uint32_t sample_rate() const { return sample_rate_; }
  uint32_t channels() const { return channels_; }
  float phase() const { return phase_; }

 private:
  float frequency_hz_;
  uint32_t sample_rate_;
  uint32_t channels_;
  float phase_;  // Radians, in [0, 2*pi)
};

}  // namespace aqueduct::capture

#endif  // AQUEDUCT_CAPTURE_SINE_WAVE_GENERATOR_H_
