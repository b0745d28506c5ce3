// Repository: Aqueduct
// Component: Frame Renderer
// Purpose: Present received video frames headlessly or in a preview window.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_RENDERER_FRAME_RENDERER_H_
#define AQUEDUCT_RENDERER_FRAME_RENDERER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "aqueduct/buffer/FrameRingBuffer.h"
#include "aqueduct/timing/MasterClock.h"

namespace aqueduct::renderer {

// RenderMode specifies the rendering output type.
enum class RenderMode {
  HEADLESS = 0,  // Consume and count frames only
  PREVIEW = 1,   // SDL2 window
};

struct RenderConfig {
  RenderMode mode;
  int window_width;
  int window_height;
  std::string window_title;
  bool vsync_enabled;

  // Added to every presentation deadline to absorb network jitter.
  int64_t presentation_delay_us;

  RenderConfig()
      : mode(RenderMode::HEADLESS),
        window_width(1280),
        window_height(720),
        window_title("Aqueduct Preview"),
        vsync_enabled(true),
        presentation_delay_us(50'000) {}
};

struct RenderStats {
  uint64_t frames_rendered;
  uint64_t frames_skipped;   // Empty-buffer polls
  uint64_t frames_dropped;   // Too late to present
  uint64_t frames_rejected;  // Not presentable (format, geometry)
  double average_render_time_ms;
  double current_render_fps;
  double frame_gap_ms;       // Deadline minus now when the frame was taken

  RenderStats()
      : frames_rendered(0),
        frames_skipped(0),
        frames_dropped(0),
        frames_rejected(0),
        average_render_time_ms(0.0),
        current_render_fps(0.0),
        frame_gap_ms(0.0) {}
};

// FrameRenderer consumes decoded video from a FrameRingBuffer filled by the
// receiver's on_frame callback.
//
// Pacing:
// - The first frame anchors sender time to the local MasterClock. Each frame
//   is presented at anchor + (timestamp - first timestamp) +
//   presentation_delay_us.
// - A frame more than 8 ms late is dropped while the buffer holds a
//   backlog, so the renderer catches up instead of drifting.
// - Without a clock, frames are presented as soon as they arrive.
//
// Thread Model:
// - One render thread pops from the ring buffer (the single consumer).
class FrameRenderer {
 public:
  virtual ~FrameRenderer();

  bool Start();
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  RenderStats GetStats() const;

  static std::unique_ptr<FrameRenderer> Create(
      const RenderConfig& config,
      buffer::FrameRingBuffer& input_buffer,
      const std::shared_ptr<timing::MasterClock>& clock = nullptr);

 protected:
  FrameRenderer(const RenderConfig& config, buffer::FrameRingBuffer& input_buffer,
                const std::shared_ptr<timing::MasterClock>& clock);

  void RenderLoop();

  // Called once on the render thread before the loop.
  virtual bool Initialize() = 0;

  // Returns false if the frame could not be presented.
  virtual bool RenderFrame(const media::MediaFrame& frame) = 0;

  virtual void Cleanup() = 0;

  void UpdateStats(double render_time_ms, double frame_gap_ms);

  RenderConfig config_;
  buffer::FrameRingBuffer& input_buffer_;
  std::shared_ptr<timing::MasterClock> clock_;

  mutable std::mutex stats_mutex_;
  RenderStats stats_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  std::unique_ptr<std::thread> render_thread_;

  bool anchored_;
  int64_t anchor_utc_us_;
  uint64_t anchor_timestamp_us_;
  std::chrono::steady_clock::time_point last_frame_time_;
};

// HeadlessRenderer consumes frames without displaying them.
class HeadlessRenderer : public FrameRenderer {
 public:
  HeadlessRenderer(const RenderConfig& config, buffer::FrameRingBuffer& input_buffer,
                   const std::shared_ptr<timing::MasterClock>& clock);
  ~HeadlessRenderer() override;

 protected:
  bool Initialize() override;
  bool RenderFrame(const media::MediaFrame& frame) override;
  void Cleanup() override;
};

// PreviewRenderer shows BGRA frames in an SDL2 window. The texture is
// recreated when the frame geometry changes.
class PreviewRenderer : public FrameRenderer {
 public:
  PreviewRenderer(const RenderConfig& config, buffer::FrameRingBuffer& input_buffer,
                  const std::shared_ptr<timing::MasterClock>& clock);
  ~PreviewRenderer() override;

 protected:
  bool Initialize() override;
  bool RenderFrame(const media::MediaFrame& frame) override;
  void Cleanup() override;

 private:
  // SDL2 handles (opaque pointers)
  void* window_;    // SDL_Window*
  void* renderer_;  // SDL_Renderer*
  void* texture_;   // SDL_Texture*
  int texture_width_;
  int texture_height_;
};

}  // namespace aqueduct::renderer

#endif  // AQUEDUCT_RENDERER_FRAME_RENDERER_H_
