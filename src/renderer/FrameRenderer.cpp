// Repository: Aqueduct
// Component: Frame Renderer
// Purpose: Present received video frames headlessly or in a preview window.
// Copyright (c) 2025 RetroVue

#include "aqueduct/renderer/FrameRenderer.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

#ifdef AQUEDUCT_SDL2_AVAILABLE
extern "C" {
#include <SDL2/SDL.h>
}
#endif

namespace aqueduct::renderer {

namespace {
constexpr int64_t kWaitFudgeUs = 1'000;          // wake a millisecond early
constexpr int64_t kDropThresholdUs = -8'000;     // drop when 8 ms late
constexpr size_t kMinDepthForDrop = 2;           // only drop with a backlog
constexpr int64_t kEmptyBufferBackoffUs = 2'000;

inline void WaitForMicros(const std::shared_ptr<timing::MasterClock>& clock,
                          int64_t duration_us) {
  if (duration_us <= 0) {
    return;
  }
  if (clock && !clock->is_fake()) {
    clock->WaitUntilUtcUs(clock->now_utc_us() + duration_us);
    return;
  }
  std::this_thread::sleep_for(std::chrono::microseconds(duration_us));
}
}  // namespace

FrameRenderer::FrameRenderer(const RenderConfig& config,
                             buffer::FrameRingBuffer& input_buffer,
                             const std::shared_ptr<timing::MasterClock>& clock)
    : config_(config),
      input_buffer_(input_buffer),
      clock_(clock),
      running_(false),
      stop_requested_(false),
      anchored_(false),
      anchor_utc_us_(0),
      anchor_timestamp_us_(0),
      last_frame_time_(std::chrono::steady_clock::now()) {}

FrameRenderer::~FrameRenderer() { Stop(); }

std::unique_ptr<FrameRenderer> FrameRenderer::Create(
    const RenderConfig& config, buffer::FrameRingBuffer& input_buffer,
    const std::shared_ptr<timing::MasterClock>& clock) {
  if (config.mode == RenderMode::PREVIEW) {
#ifdef AQUEDUCT_SDL2_AVAILABLE
    return std::make_unique<PreviewRenderer>(config, input_buffer, clock);
#else
    std::cerr << "[FrameRenderer] WARNING: SDL2 not available, using headless mode"
              << std::endl;
    return std::make_unique<HeadlessRenderer>(config, input_buffer, clock);
#endif
  }

  return std::make_unique<HeadlessRenderer>(config, input_buffer, clock);
}

bool FrameRenderer::Start() {
  if (running_.load(std::memory_order_acquire) || render_thread_) {
    std::cerr << "[FrameRenderer] Already running" << std::endl;
    return false;
  }

  stop_requested_.store(false, std::memory_order_release);
  anchored_ = false;
  render_thread_ = std::make_unique<std::thread>(&FrameRenderer::RenderLoop, this);

  std::cout << "[FrameRenderer] Started" << std::endl;
  return true;
}

void FrameRenderer::Stop() {
  if (!running_.load(std::memory_order_acquire) && !render_thread_) {
    return;
  }

  std::cout << "[FrameRenderer] Stopping..." << std::endl;
  stop_requested_.store(true, std::memory_order_release);

  if (render_thread_ && render_thread_->joinable()) {
    render_thread_->join();
  }

  render_thread_.reset();
  running_.store(false, std::memory_order_release);

  std::cout << "[FrameRenderer] Stopped. Total frames rendered: " << GetStats().frames_rendered
            << std::endl;
}

RenderStats FrameRenderer::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void FrameRenderer::RenderLoop() {
  std::cout << "[FrameRenderer] Render loop started (mode="
            << (config_.mode == RenderMode::HEADLESS ? "HEADLESS" : "PREVIEW") << ")"
            << std::endl;

  if (!Initialize()) {
    std::cerr << "[FrameRenderer] Failed to initialize" << std::endl;
    return;
  }

  running_.store(true, std::memory_order_release);
  last_frame_time_ = std::chrono::steady_clock::now();

  while (!stop_requested_.load(std::memory_order_acquire)) {
    const auto frame_start = std::chrono::steady_clock::now();

    media::MediaFrame frame;
    if (!input_buffer_.Pop(frame)) {
      WaitForMicros(clock_, kEmptyBufferBackoffUs);
      std::lock_guard<std::mutex> lock(stats_mutex_);
      stats_.frames_skipped++;
      continue;
    }

    double frame_gap_ms = 0.0;
    if (clock_) {
      if (!anchored_) {
        anchor_utc_us_ = clock_->now_utc_us();
        anchor_timestamp_us_ = frame.timestamp_us;
        anchored_ = true;
      }
      const int64_t offset_us =
          static_cast<int64_t>(frame.timestamp_us) - static_cast<int64_t>(anchor_timestamp_us_);
      const int64_t deadline_utc = anchor_utc_us_ + offset_us + config_.presentation_delay_us;
      const int64_t gap_us = deadline_utc - clock_->now_utc_us();
      frame_gap_ms = static_cast<double>(gap_us) / 1'000.0;

      if (gap_us > 0) {
        clock_->WaitUntilUtcUs(deadline_utc - kWaitFudgeUs);
      } else if (gap_us < kDropThresholdUs && input_buffer_.Size() >= kMinDepthForDrop) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.frames_dropped++;
        continue;
      }
    }

    if (!RenderFrame(frame)) {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      stats_.frames_rejected++;
      continue;
    }

    const auto frame_end = std::chrono::steady_clock::now();
    const double render_time_ms =
        std::chrono::duration<double, std::milli>(frame_end - frame_start).count();
    if (!clock_) {
      frame_gap_ms =
          std::chrono::duration<double, std::milli>(frame_end - last_frame_time_).count();
    }
    last_frame_time_ = frame_end;

    UpdateStats(render_time_ms, frame_gap_ms);

    const RenderStats stats = GetStats();
    if (stats.frames_rendered % 100 == 0) {
      std::cout << "[FrameRenderer] Rendered " << stats.frames_rendered
                << " frames, avg render time: " << stats.average_render_time_ms << "ms, "
                << "dropped: " << stats.frames_dropped << ", gap: " << frame_gap_ms << "ms"
                << std::endl;
    }
  }

  Cleanup();
  running_.store(false, std::memory_order_release);

  std::cout << "[FrameRenderer] Render loop exited" << std::endl;
}

void FrameRenderer::UpdateStats(double render_time_ms, double frame_gap_ms) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.frames_rendered++;
  stats_.frame_gap_ms = frame_gap_ms;

  // Exponential moving average
  const double alpha = 0.1;
  stats_.average_render_time_ms =
      alpha * render_time_ms + (1.0 - alpha) * stats_.average_render_time_ms;

  const double interval_ms = clock_ ? 0.0 : frame_gap_ms;
  if (interval_ms > 0.0) {
    stats_.current_render_fps = 1000.0 / interval_ms;
  }
}

// ============================================================================
// HeadlessRenderer
// ============================================================================

HeadlessRenderer::HeadlessRenderer(const RenderConfig& config,
                                   buffer::FrameRingBuffer& input_buffer,
                                   const std::shared_ptr<timing::MasterClock>& clock)
    : FrameRenderer(config, input_buffer, clock) {}

HeadlessRenderer::~HeadlessRenderer() {
  Stop();
}

bool HeadlessRenderer::Initialize() {
  std::cout << "[HeadlessRenderer] Initialized (no display output)" << std::endl;
  return true;
}

bool HeadlessRenderer::RenderFrame(const media::MediaFrame& frame) {
  return frame.type == wire::PacketType::kVideo && frame.data() != nullptr &&
         frame.size == frame.video.raw_size;
}

void HeadlessRenderer::Cleanup() {
  std::cout << "[HeadlessRenderer] Cleanup complete" << std::endl;
}

// ============================================================================
// PreviewRenderer
// ============================================================================

#ifdef AQUEDUCT_SDL2_AVAILABLE

PreviewRenderer::PreviewRenderer(const RenderConfig& config,
                                 buffer::FrameRingBuffer& input_buffer,
                                 const std::shared_ptr<timing::MasterClock>& clock)
    : FrameRenderer(config, input_buffer, clock),
      window_(nullptr),
      renderer_(nullptr),
      texture_(nullptr),
      texture_width_(0),
      texture_height_(0) {}

PreviewRenderer::~PreviewRenderer() {
  Stop();
}

bool PreviewRenderer::Initialize() {
  std::cout << "[PreviewRenderer] Initializing SDL2..." << std::endl;

  if (SDL_Init(SDL_INIT_VIDEO) < 0) {
    std::cerr << "[PreviewRenderer] SDL_Init failed: " << SDL_GetError() << std::endl;
    return false;
  }

  SDL_Window* window = SDL_CreateWindow(
      config_.window_title.c_str(),
      SDL_WINDOWPOS_CENTERED,
      SDL_WINDOWPOS_CENTERED,
      config_.window_width,
      config_.window_height,
      SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
  if (!window) {
    std::cerr << "[PreviewRenderer] SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
    SDL_Quit();
    return false;
  }
  window_ = window;

  Uint32 flags = SDL_RENDERER_ACCELERATED;
  if (config_.vsync_enabled) {
    flags |= SDL_RENDERER_PRESENTVSYNC;
  }

  SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, flags);
  if (!renderer) {
    std::cerr << "[PreviewRenderer] SDL_CreateRenderer failed: " << SDL_GetError()
              << std::endl;
    SDL_DestroyWindow(window);
    window_ = nullptr;
    SDL_Quit();
    return false;
  }
  renderer_ = renderer;

  std::cout << "[PreviewRenderer] Initialized successfully: " << config_.window_width << "x"
            << config_.window_height << std::endl;
  return true;
}

bool PreviewRenderer::RenderFrame(const media::MediaFrame& frame) {
  SDL_Renderer* renderer = static_cast<SDL_Renderer*>(renderer_);

  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    if (event.type == SDL_QUIT) {
      stop_requested_.store(true, std::memory_order_release);
      return true;
    }
  }

  if (frame.type != wire::PacketType::kVideo ||
      frame.video.pixel_format != media::PixelFormat::kBGRA || frame.data() == nullptr ||
      frame.size != frame.video.raw_size) {
    return false;
  }

  const int width = static_cast<int>(frame.video.width);
  const int height = static_cast<int>(frame.video.height);
  if (!texture_ || width != texture_width_ || height != texture_height_) {
    if (texture_) {
      SDL_DestroyTexture(static_cast<SDL_Texture*>(texture_));
      texture_ = nullptr;
    }
    // BGRA bytes in memory are ARGB8888 on little-endian hosts.
    SDL_Texture* texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ARGB8888,
                                             SDL_TEXTUREACCESS_STREAMING, width, height);
    if (!texture) {
      std::cerr << "[PreviewRenderer] SDL_CreateTexture failed: " << SDL_GetError()
                << std::endl;
      return false;
    }
    texture_ = texture;
    texture_width_ = width;
    texture_height_ = height;
  }

  SDL_Texture* texture = static_cast<SDL_Texture*>(texture_);
  SDL_UpdateTexture(texture, nullptr, frame.data(), width * 4);

  SDL_RenderClear(renderer);
  SDL_RenderCopy(renderer, texture, nullptr, nullptr);
  SDL_RenderPresent(renderer);
  return true;
}

void PreviewRenderer::Cleanup() {
  std::cout << "[PreviewRenderer] Cleaning up SDL2..." << std::endl;

  if (texture_) {
    SDL_DestroyTexture(static_cast<SDL_Texture*>(texture_));
    texture_ = nullptr;
  }
  if (renderer_) {
    SDL_DestroyRenderer(static_cast<SDL_Renderer*>(renderer_));
    renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(static_cast<SDL_Window*>(window_));
    window_ = nullptr;
  }

  SDL_Quit();
  std::cout << "[PreviewRenderer] Cleanup complete" << std::endl;
}

#else
// Stub implementations when SDL2 not available

PreviewRenderer::PreviewRenderer(const RenderConfig& config,
                                 buffer::FrameRingBuffer& input_buffer,
                                 const std::shared_ptr<timing::MasterClock>& clock)
    : FrameRenderer(config, input_buffer, clock),
      window_(nullptr),
      renderer_(nullptr),
      texture_(nullptr),
      texture_width_(0),
      texture_height_(0) {}

PreviewRenderer::~PreviewRenderer() {
  Stop();
}

bool PreviewRenderer::Initialize() {
  std::cerr << "[PreviewRenderer] ERROR: SDL2 not available. Rebuild with SDL2 for preview mode."
            << std::endl;
  return false;
}

bool PreviewRenderer::RenderFrame(const media::MediaFrame& frame) {
  (void)frame;
  return false;
}

void PreviewRenderer::Cleanup() {}

#endif  // AQUEDUCT_SDL2_AVAILABLE

}  // namespace aqueduct::renderer
