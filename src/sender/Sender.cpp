// Repository: Aqueduct
// Component: Sender
// Purpose: Accepts receivers and fans stamped, compressed, framed media out to all of them.
// Copyright (c) 2025 RetroVue

#include "aqueduct/sender/Sender.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

#include "aqueduct/codec/CodecFactory.h"
#include "aqueduct/media/MediaDescriptors.h"
#include "aqueduct/wire/PacketCodec.h"

#define INVALID_SOCKET -1
#define SOCKET_ERROR -1
#define CLOSE_SOCKET close

namespace aqueduct::sender {

namespace {

constexpr int kAcceptPollMs = 10;
constexpr int64_t kPushSliceUs = 50'000;
constexpr uint64_t kProgressLogInterval = 1000;

int64_t SteadyNowUs() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

}  // namespace

Sender::Sender(const SenderConfig& config,
               std::shared_ptr<buffer::BufferPool> pool,
               std::unique_ptr<codec::ICodec> codec,
               std::shared_ptr<timing::MasterClock> clock,
               discovery::IDiscovery* discovery)
    : config_(config),
      pool_(std::move(pool)),
      codec_(codec ? std::move(codec) : codec::MakeCodec(codec::CodecKind::kPassthrough)),
      codec_name_(codec_->Name()),
      clock_(clock ? std::move(clock) : timing::MakeSystemMasterClock()),
      discovery_(discovery),
      sender_clock_(clock_),
      running_(false),
      stop_requested_(false),
      listen_socket_(INVALID_SOCKET),
      bound_port_(0),
      next_connection_id_(1),
      active_sources_(0) {}

Sender::~Sender() {
  Stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool Sender::ValidateConfig() const {
  if (!pool_) {
    std::cerr << "[Sender] Invalid config: no buffer pool" << std::endl;
    return false;
  }
  if (config_.queue_capacity == 0) {
    std::cerr << "[Sender] Invalid config: queue_capacity must be > 0" << std::endl;
    return false;
  }
  if (config_.max_connections == 0) {
    std::cerr << "[Sender] Invalid config: max_connections must be > 0" << std::endl;
    return false;
  }
  if (config_.max_payload_bytes == 0 ||
      static_cast<size_t>(config_.max_payload_bytes) + wire::kHeaderSize >
          pool_->config().max_buffer_bytes) {
    std::cerr << "[Sender] Invalid config: max_payload_bytes " << config_.max_payload_bytes
              << " does not fit pool max_buffer_bytes " << pool_->config().max_buffer_bytes
              << std::endl;
    return false;
  }
  in_addr probe{};
  if (inet_pton(AF_INET, config_.bind_host.c_str(), &probe) != 1) {
    std::cerr << "[Sender] Invalid config: bind_host '" << config_.bind_host
              << "' is not an IPv4 address" << std::endl;
    return false;
  }
  if (config_.advertise && discovery_ && config_.name.empty()) {
    std::cerr << "[Sender] Invalid config: cannot advertise an unnamed sender" << std::endl;
    return false;
  }
  return true;
}

bool Sender::OpenListenSocket() {
  listen_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_socket_ == INVALID_SOCKET) {
    std::cerr << "[Sender] Failed to create socket" << std::endl;
    return false;
  }

  int opt = 1;
  setsockopt(listen_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.port);
  inet_pton(AF_INET, config_.bind_host.c_str(), &addr.sin_addr);

  if (bind(listen_socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == SOCKET_ERROR) {
    std::cerr << "[Sender] Failed to bind " << config_.bind_host << ":" << config_.port << ": "
              << std::strerror(errno) << std::endl;
    CLOSE_SOCKET(listen_socket_);
    listen_socket_ = INVALID_SOCKET;
    return false;
  }

  if (listen(listen_socket_, SOMAXCONN) == SOCKET_ERROR) {
    std::cerr << "[Sender] Failed to listen: " << std::strerror(errno) << std::endl;
    CLOSE_SOCKET(listen_socket_);
    listen_socket_ = INVALID_SOCKET;
    return false;
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (getsockname(listen_socket_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = config_.port;
  }

  // Non-blocking so the accept loop can notice Stop().
  int flags = fcntl(listen_socket_, F_GETFL, 0);
  fcntl(listen_socket_, F_SETFL, flags | O_NONBLOCK);
  return true;
}

bool Sender::Start() {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[Sender] Already running" << std::endl;
    return false;
  }
  if (!ValidateConfig()) {
    return false;
  }
  if (!OpenListenSocket()) {
    return false;
  }

  sender_clock_.Reset();
  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  accept_thread_ = std::make_unique<std::thread>(&Sender::AcceptLoop, this);

  if (config_.advertise && discovery_) {
    if (!discovery_->Advertise(config_.name, bound_port_)) {
      std::cerr << "[Sender] Discovery advertisement failed; direct connections only"
                << std::endl;
    }
  }

  std::cout << "[Sender] '" << config_.name << "' listening on " << config_.bind_host << ":"
            << bound_port_ << " (codec=" << codec_name_
            << ", queue=" << config_.queue_capacity
            << ", policy=" << buffer::OverloadPolicyToString(config_.overload_policy) << ")"
            << std::endl;
  return true;
}

void Sender::Stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::cout << "[Sender] Stopping..." << std::endl;
  stop_requested_.store(true, std::memory_order_release);

  // 1. No new receivers.
  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }
  accept_thread_.reset();
  if (listen_socket_ != INVALID_SOCKET) {
    CLOSE_SOCKET(listen_socket_);
    listen_socket_ = INVALID_SOCKET;
  }

  // 2. No new frames.
  std::vector<AttachedSource> sources;
  {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    for (auto& attached : sources_) {
      attached.source->Stop();
    }
    sources.swap(sources_);
  }
  for (auto& attached : sources) {
    if (attached.thread && attached.thread->joinable()) {
      attached.thread->join();
    }
  }
  sources.clear();

  // 3. Best-effort end of stream, bounded by the drain timeout.
  const int64_t deadline_us = SteadyNowUs() + config_.drain_timeout_ms * 1000;
  {
    std::lock_guard<std::mutex> lock(submit_mutex_);
    ReapClosedConnections();

    media::MediaFrame eos;
    eos.type = wire::PacketType::kControl;
    eos.flags = wire::flags::kEndOfStream;
    eos.timestamp_us = sender_clock_.Stamp(wire::PacketType::kControl);

    buffer::OutboundPacket packet;
    if (BuildPacket(eos, &packet)) {
      FanOut(packet, deadline_us);
    }
  }

  // 4. Drain and close every connection.
  std::vector<std::shared_ptr<Connection>> connections;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections.swap(connections_);
  }
  for (const auto& connection : connections) {
    const int64_t remaining = std::max<int64_t>(0, deadline_us - SteadyNowUs());
    if (!connection->Drain(remaining)) {
      std::cerr << "[Sender] Connection " << connection->id()
                << " did not drain before the timeout" << std::endl;
    }
    RetireConnection(connection);
  }

  if (config_.advertise && discovery_) {
    discovery_->Stop();
  }

  running_.store(false, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    active_sources_ = 0;
  }
  sources_cv_.notify_all();

  const SenderStats stats = GetStats();
  std::cout << "[Sender] Stopped: frames_sent=" << stats.frames_sent
            << ", codec_errors=" << stats.codec_errors
            << ", connections_accepted=" << stats.connections_accepted
            << ", bytes_sent=" << stats.bytes_sent << std::endl;
}

// ============================================================================
// Accept
// ============================================================================

void Sender::AcceptLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    sockaddr_in peer_addr{};
    socklen_t peer_len = sizeof(peer_addr);
    const int fd = accept(listen_socket_, reinterpret_cast<sockaddr*>(&peer_addr), &peer_len);

    if (fd == INVALID_SOCKET) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        std::cerr << "[Sender] accept failed: " << std::strerror(errno) << std::endl;
      }
      ReapClosedConnections();
      std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptPollMs));
      continue;
    }

    // Writers block in send(); the accepted socket must not inherit O_NONBLOCK.
    const int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);

    int nodelay = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
    if (config_.send_buffer_bytes > 0) {
      setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &config_.send_buffer_bytes,
                 sizeof(config_.send_buffer_bytes));
    }

    char host[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &peer_addr.sin_addr, host, sizeof(host));
    const std::string peer = std::string(host) + ":" + std::to_string(ntohs(peer_addr.sin_port));

    ReapClosedConnections();

    std::shared_ptr<Connection> connection;
    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      if (connections_.size() < config_.max_connections) {
        connection = std::make_shared<Connection>(next_connection_id_++, fd, peer,
                                                  config_.queue_capacity,
                                                  config_.overload_policy);
        connection->Start();
        connections_.push_back(connection);
      }
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (!connection) {
      stats_.connections_refused++;
      CLOSE_SOCKET(fd);
      std::cerr << "[Sender] Refused " << peer << ": " << config_.max_connections
                << " connections already open" << std::endl;
      continue;
    }
    stats_.connections_accepted++;
    std::cout << "[Sender] Accepted connection " << connection->id() << " from " << peer
              << std::endl;
  }
}

void Sender::ReapClosedConnections() {
  std::vector<std::shared_ptr<Connection>> closed;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = std::stable_partition(
        connections_.begin(), connections_.end(),
        [](const std::shared_ptr<Connection>& c) { return c->IsOpen(); });
    closed.assign(it, connections_.end());
    connections_.erase(it, connections_.end());
  }
  for (const auto& connection : closed) {
    RetireConnection(connection);
  }
}

void Sender::RetireConnection(const std::shared_ptr<Connection>& connection) {
  connection->Close();
  const ConnectionInfo info = connection->Info();

  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.connections_closed++;
  stats_.bytes_sent += info.bytes_sent;
  stats_.packets_dropped += info.packets_dropped;
}

bool Sender::CloseConnection(uint64_t id) {
  std::shared_ptr<Connection> target;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [id](const std::shared_ptr<Connection>& c) { return c->id() == id; });
    if (it == connections_.end()) {
      return false;
    }
    target = *it;
    connections_.erase(it);
  }
  std::cout << "[Sender] Closing connection " << id << " on request" << std::endl;
  RetireConnection(target);
  return true;
}

std::vector<ConnectionInfo> Sender::ListConnections() const {
  std::vector<ConnectionInfo> result;
  std::lock_guard<std::mutex> lock(connections_mutex_);
  result.reserve(connections_.size());
  for (const auto& connection : connections_) {
    result.push_back(connection->Info());
  }
  return result;
}

size_t Sender::ConnectionCount() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return static_cast<size_t>(
      std::count_if(connections_.begin(), connections_.end(),
                    [](const std::shared_ptr<Connection>& c) { return c->IsOpen(); }));
}

SenderStats Sender::GetStats() const {
  SenderStats stats;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats = stats_;
  }
  std::lock_guard<std::mutex> lock(connections_mutex_);
  for (const auto& connection : connections_) {
    const ConnectionInfo info = connection->Info();
    stats.bytes_sent += info.bytes_sent;
    stats.packets_dropped += info.packets_dropped;
    if (info.open) {
      stats.active_connections++;
    }
  }
  return stats;
}

// ============================================================================
// Intake
// ============================================================================

bool Sender::AttachSource(std::unique_ptr<capture::ICaptureSource> source) {
  if (!source) {
    return false;
  }
  if (!running_.load(std::memory_order_acquire) ||
      stop_requested_.load(std::memory_order_acquire)) {
    std::cerr << "[Sender] Cannot attach source '" << source->Name() << "': not running"
              << std::endl;
    return false;
  }

  std::lock_guard<std::mutex> lock(sources_mutex_);
  AttachedSource attached;
  attached.source = std::move(source);
  active_sources_++;
  attached.thread =
      std::make_unique<std::thread>(&Sender::IntakeLoop, this, attached.source.get());
  std::cout << "[Sender] Attached source '" << attached.source->Name() << "'" << std::endl;
  sources_.push_back(std::move(attached));
  return true;
}

void Sender::IntakeLoop(capture::ICaptureSource* source) {
  uint64_t frames = 0;
  while (!stop_requested_.load(std::memory_order_acquire)) {
    media::MediaFrame frame;
    if (!source->Next(frame)) {
      break;
    }
    SubmitFrame(std::move(frame));
    frames++;
  }
  std::cout << "[Sender] Source '" << source->Name() << "' finished after " << frames
            << " frames" << std::endl;

  {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    if (active_sources_ > 0) {
      active_sources_--;
    }
  }
  sources_cv_.notify_all();
}

bool Sender::WaitForSources(int64_t timeout_ms) {
  std::unique_lock<std::mutex> lock(sources_mutex_);
  auto done = [this] { return active_sources_ == 0; };
  if (timeout_ms < 0) {
    sources_cv_.wait(lock, done);
    return true;
  }
  return sources_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), done);
}

// ============================================================================
// Submit
// ============================================================================

bool Sender::SubmitFrame(media::MediaFrame&& frame) {
  if (!running_.load(std::memory_order_acquire) ||
      stop_requested_.load(std::memory_order_acquire)) {
    return false;
  }

  std::lock_guard<std::mutex> submit_lock(submit_mutex_);
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_submitted++;
  }

  frame.timestamp_us = sender_clock_.Stamp(frame.type);

  buffer::OutboundPacket packet;
  if (!BuildPacket(frame, &packet)) {
    return false;
  }

  const size_t queued = FanOut(packet, -1);

  uint64_t frames_sent = 0;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    frames_sent = ++stats_.frames_sent;
    stats_.packets_enqueued += queued;
    if (queued == 0) {
      stats_.frames_without_peers++;
    }
  }
  if (frames_sent % kProgressLogInterval == 0) {
    std::cout << "[Sender] " << frames_sent << " frames sent, " << ConnectionCount()
              << " receivers" << std::endl;
  }
  return true;
}

bool Sender::BuildPacket(media::MediaFrame& frame, buffer::OutboundPacket* packet) {
  // The sender decides compression; a caller-supplied kCompressed bit is
  // meaningless.
  const uint32_t flags = frame.flags & ~wire::flags::kCompressed;

  // The content view must lie inside the frame's storage.
  const size_t capacity = frame.storage.capacity();
  if (frame.size > 0 &&
      (!frame.storage.valid() || frame.offset > capacity || frame.size > capacity - frame.offset)) {
    std::cerr << "[Sender] Rejecting " << wire::PacketTypeToString(frame.type)
              << " frame: view offset=" << frame.offset << " size=" << frame.size
              << " outside storage of " << capacity << " bytes" << std::endl;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_rejected++;
    return false;
  }

  switch (frame.type) {
    case wire::PacketType::kVideo: {
      const media::VideoDescriptor& desc = frame.video;
      const size_t expected =
          media::RawFrameSize(desc.pixel_format, desc.width, desc.height);
      if (frame.size != desc.raw_size || expected != desc.raw_size || expected == 0) {
        std::cerr << "[Sender] Rejecting video frame: " << desc.width << "x" << desc.height
                  << " " << media::PixelFormatToString(desc.pixel_format) << " needs "
                  << expected << " bytes, descriptor says " << desc.raw_size << ", frame has "
                  << frame.size << std::endl;
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.frames_rejected++;
        return false;
      }
      if (!codec_->IsPassthrough() && codec_->Supports(desc.pixel_format)) {
        return FrameCompressedVideo(frame, packet);
      }
      uint8_t descriptor[media::kVideoDescriptorSize];
      media::EncodeVideoDescriptor(desc, descriptor, sizeof(descriptor));
      return FrameUncompressed(frame, descriptor, sizeof(descriptor), flags, packet);
    }

    case wire::PacketType::kAudio: {
      if (frame.size != frame.audio.SampleBytes()) {
        std::cerr << "[Sender] Rejecting audio frame: descriptor implies "
                  << frame.audio.SampleBytes() << " bytes, frame has " << frame.size
                  << std::endl;
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.frames_rejected++;
        return false;
      }
      uint8_t descriptor[media::kAudioDescriptorSize];
      media::EncodeAudioDescriptor(frame.audio, descriptor, sizeof(descriptor));
      return FrameUncompressed(frame, descriptor, sizeof(descriptor), flags, packet);
    }

    case wire::PacketType::kMetadata:
    case wire::PacketType::kControl:
      return FrameUncompressed(frame, nullptr, 0, flags, packet);

    default:
      std::lock_guard<std::mutex> lock(stats_mutex_);
      stats_.frames_rejected++;
      return false;
  }
}

bool Sender::FrameUncompressed(media::MediaFrame& frame, const uint8_t* descriptor,
                               size_t descriptor_size, uint32_t flags,
                               buffer::OutboundPacket* packet) {
  const size_t prefix = wire::kHeaderSize + descriptor_size;
  const size_t payload_size = descriptor_size + frame.size;
  if (payload_size > config_.max_payload_bytes) {
    std::cerr << "[Sender] Rejecting " << wire::PacketTypeToString(frame.type) << " frame: "
              << payload_size << " bytes exceeds max_payload_bytes" << std::endl;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_rejected++;
    return false;
  }

  wire::PacketHeader header;
  header.length = static_cast<uint32_t>(payload_size);
  header.type = frame.type;
  header.timestamp_us = frame.timestamp_us;
  header.flags = flags;

  const bool in_place = frame.storage.valid() && frame.headroom() >= prefix &&
                        frame.offset + frame.size <= frame.storage.capacity();
  if (in_place) {
    const size_t start = frame.offset - prefix;
    uint8_t* base = frame.storage.data() + start;
    wire::EncodeHeaderInto(header, base, prefix);
    if (descriptor_size > 0) {
      std::memcpy(base + wire::kHeaderSize, descriptor, descriptor_size);
    }
    frame.storage.set_size(frame.offset + frame.size);
    packet->buffer = buffer::Share(std::move(frame.storage));
    packet->offset = start;
  } else {
    buffer::PooledBuffer out = pool_->Acquire(prefix + frame.size);
    if (!out.valid()) {
      std::cerr << "[Sender] No buffer for " << prefix + frame.size << "-byte packet"
                << std::endl;
      std::lock_guard<std::mutex> lock(stats_mutex_);
      stats_.frames_rejected++;
      return false;
    }
    wire::EncodeHeaderInto(header, out.data(), out.capacity());
    if (descriptor_size > 0) {
      std::memcpy(out.data() + wire::kHeaderSize, descriptor, descriptor_size);
    }
    if (frame.size > 0) {
      std::memcpy(out.data() + prefix, frame.data(), frame.size);
    }
    out.set_size(prefix + frame.size);
    frame.storage.Reset();
    packet->buffer = buffer::Share(std::move(out));
    packet->offset = 0;
  }

  packet->size = prefix + frame.size;
  packet->type = frame.type;
  packet->flags = flags;
  return true;
}

bool Sender::FrameCompressedVideo(media::MediaFrame& frame, buffer::OutboundPacket* packet) {
  constexpr size_t kPrefix = wire::kHeaderSize + media::kVideoDescriptorSize;
  const size_t bound = codec_->MaxCompressedSize(frame.video);

  buffer::PooledBuffer out = pool_->Acquire(kPrefix + bound);
  if (!out.valid()) {
    std::cerr << "[Sender] No buffer for " << kPrefix + bound << "-byte compressed frame"
              << std::endl;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_rejected++;
    return false;
  }

  size_t written = 0;
  const codec::CodecStatus status =
      codec_->Compress(frame.video, frame.data(), frame.size, out.data() + kPrefix,
                       out.capacity() - kPrefix, &written);
  if (status != codec::CodecStatus::kOk) {
    uint64_t errors = 0;
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      errors = ++stats_.codec_errors;
    }
    std::cerr << "[Sender] Dropping video frame at " << frame.timestamp_us
              << "us: " << codec::CodecStatusToString(status) << " (" << errors << " total)"
              << std::endl;
    return false;
  }

  const size_t payload_size = media::kVideoDescriptorSize + written;
  if (payload_size > config_.max_payload_bytes) {
    std::cerr << "[Sender] Rejecting compressed frame: " << payload_size
              << " bytes exceeds max_payload_bytes" << std::endl;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_rejected++;
    return false;
  }

  const uint32_t flags = (frame.flags & ~wire::flags::kCompressed) | wire::flags::kCompressed;
  wire::PacketHeader header;
  header.length = static_cast<uint32_t>(payload_size);
  header.type = wire::PacketType::kVideo;
  header.timestamp_us = frame.timestamp_us;
  header.flags = flags;

  wire::EncodeHeaderInto(header, out.data(), out.capacity());
  media::EncodeVideoDescriptor(frame.video, out.data() + wire::kHeaderSize,
                               media::kVideoDescriptorSize);
  out.set_size(kPrefix + written);

  // The raw frame is no longer needed.
  frame.storage.Reset();

  packet->buffer = buffer::Share(std::move(out));
  packet->offset = 0;
  packet->size = kPrefix + written;
  packet->type = wire::PacketType::kVideo;
  packet->flags = flags;

  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.frames_compressed++;
  return true;
}

size_t Sender::FanOut(const buffer::OutboundPacket& packet, int64_t deadline_us) {
  std::vector<std::shared_ptr<Connection>> targets;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    targets = connections_;
  }

  size_t queued = 0;
  for (const auto& connection : targets) {
    while (true) {
      const buffer::PushResult result = connection->Enqueue(packet, kPushSliceUs);
      if (result == buffer::PushResult::kQueued) {
        queued++;
        break;
      }
      if (result == buffer::PushResult::kClosed) {
        break;
      }
      // Timed out: the receiver is slow. Keep waiting unless we are giving up.
      if (deadline_us < 0 ? stop_requested_.load(std::memory_order_acquire)
                          : SteadyNowUs() >= deadline_us) {
        break;
      }
    }
  }
  return queued;
}

}  // namespace aqueduct::sender
