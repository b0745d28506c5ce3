// Repository: Aqueduct
// Component: Synthetic Source
// Purpose: Paced test-pattern video, sine-tone audio and tally metadata.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_CAPTURE_SYNTHETIC_SOURCE_H_
#define AQUEDUCT_CAPTURE_SYNTHETIC_SOURCE_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/capture/ICaptureSource.h"
#include "aqueduct/capture/SineWaveGenerator.h"
#include "aqueduct/timing/MasterClock.h"

namespace aqueduct::capture {

struct SyntheticSourceConfig {
  std::string label = "synthetic";  // Carried in tally metadata

  uint32_t width = 640;
  uint32_t height = 360;
  double target_fps = 30.0;

  bool audio_enabled = true;
  float tone_hz = 440.0f;
  uint32_t sample_rate = 48000;
  uint32_t channels = 2;
  uint32_t samples_per_frame = 1600;

  // Tally XML every N video frames (0 = never).
  uint32_t metadata_interval_frames = 30;

  // Video frames to produce before the source is exhausted (0 = unlimited).
  uint64_t max_frames = 0;

  // Wait for each frame's deadline on the MasterClock. Disable for tests
  // that want frames as fast as possible.
  bool paced = true;
};

// SyntheticSource emits, per video tick: one BGRA test-pattern frame
// (flagged kKeyFrame), one audio chunk and, every metadata_interval_frames,
// a tally document. Frames are allocated from the pool with
// media::kFrameHeadroom bytes free in front.
class SyntheticSource : public ICaptureSource {
 public:
  SyntheticSource(const SyntheticSourceConfig& config,
                  std::shared_ptr<buffer::BufferPool> pool,
                  std::shared_ptr<timing::MasterClock> clock = nullptr);
  ~SyntheticSource() override = default;

  const char* Name() const override { return config_.label.c_str(); }
  bool Next(media::MediaFrame& frame) override;
  void Stop() override;

  uint64_t video_frames() const { return video_frames_; }

 private:
  enum class Step { kVideo, kAudio, kMetadata };

  bool ProduceVideo(media::MediaFrame& frame);
  bool ProduceAudio(media::MediaFrame& frame);
  bool ProduceMetadata(media::MediaFrame& frame);
  void FillTestPattern(uint8_t* bgra, uint64_t frame_index) const;
  void WaitForDeadline();

  const SyntheticSourceConfig config_;
  std::shared_ptr<buffer::BufferPool> pool_;
  std::shared_ptr<timing::MasterClock> clock_;
  SineWaveGenerator tone_;

  std::atomic<bool> stop_requested_;
  Step next_step_;
  uint64_t video_frames_;
  const int64_t frame_interval_us_;
  int64_t next_deadline_utc_us_;
};

}  // namespace aqueduct::capture

#endif  // AQUEDUCT_CAPTURE_SYNTHETIC_SOURCE_H_
