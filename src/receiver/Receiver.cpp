// Repository: Aqueduct
// Component: Receiver
// Purpose: One TCP connection to a sender: reassembly, sync validation and media decode.
// Copyright (c) 2025 RetroVue

#include "aqueduct/receiver/Receiver.h"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

#include "aqueduct/codec/CodecFactory.h"
#include "aqueduct/media/MediaDescriptors.h"

#define INVALID_SOCKET -1
#define CLOSE_SOCKET close

namespace aqueduct::receiver {

namespace {

// Codec errors are logged on the first occurrence and then every Nth.
constexpr uint64_t kCodecErrorLogInterval = 100;

}  // namespace

Receiver::Receiver(const ReceiverConfig& config,
                   std::shared_ptr<buffer::BufferPool> pool,
                   std::unique_ptr<codec::ICodec> codec,
                   ReceiverCallbacks callbacks)
    : config_(config),
      pool_(std::move(pool)),
      codec_(codec ? std::move(codec) : codec::MakeCodec(codec::CodecKind::kPassthrough)),
      callbacks_(std::move(callbacks)),
      socket_(INVALID_SOCKET),
      synchronizer_(config.max_skew_us),
      running_(false),
      stop_requested_(false) {}

Receiver::~Receiver() {
  Close();
}

bool Receiver::Connect(const discovery::SenderRecord& record) {
  std::cout << "[Receiver] Connecting to '" << record.name << "'" << std::endl;
  return Connect(record.host, record.port);
}

bool Receiver::Connect(const std::string& host, uint16_t port) {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[Receiver] Already connected" << std::endl;
    return false;
  }
  if (!pool_) {
    std::cerr << "[Receiver] No buffer pool" << std::endl;
    return false;
  }

  // Reap a previous, already finished connection.
  Close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  const std::string port_str = std::to_string(port);
  const int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
  if (gai != 0) {
    std::cerr << "[Receiver] Cannot resolve " << host << ": " << gai_strerror(gai) << std::endl;
    return false;
  }

  int fd = INVALID_SOCKET;
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd == INVALID_SOCKET) {
      continue;
    }
    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    CLOSE_SOCKET(fd);
    fd = INVALID_SOCKET;
  }
  freeaddrinfo(results);

  if (fd == INVALID_SOCKET) {
    std::cerr << "[Receiver] Failed to connect to " << host << ":" << port << ": "
              << std::strerror(errno) << std::endl;
    return false;
  }

  int nodelay = 1;
  setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
  if (config_.receive_buffer_bytes > 0) {
    setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &config_.receive_buffer_bytes,
               sizeof(config_.receive_buffer_bytes));
  }

  socket_ = fd;
  machine_ = std::make_unique<ReassemblyStateMachine>(pool_, config_.max_payload_bytes,
                                                      &stop_requested_);
  synchronizer_.Reset();
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = ReceiverStats();
    stats_.connected = true;
  }

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  read_thread_ = std::make_unique<std::thread>(&Receiver::ReadLoop, this);

  std::cout << "[Receiver] Connected to " << host << ":" << port << " (codec=" << codec_->Name()
            << ")" << std::endl;
  return true;
}

void Receiver::Close() {
  stop_requested_.store(true, std::memory_order_release);

  // Unblocks recv() in the read thread.
  if (socket_ != INVALID_SOCKET) {
    shutdown(socket_, SHUT_RDWR);
  }

  if (read_thread_ && read_thread_->joinable()) {
    read_thread_->join();
  }
  read_thread_.reset();

  if (socket_ != INVALID_SOCKET) {
    CLOSE_SOCKET(socket_);
    socket_ = INVALID_SOCKET;
  }
  machine_.reset();
}

bool Receiver::WaitForClose(int64_t timeout_ms) {
  std::unique_lock<std::mutex> lock(stats_mutex_);
  auto closed = [this] { return !running_.load(std::memory_order_acquire); };
  if (timeout_ms < 0) {
    closed_cv_.wait(lock, closed);
    return true;
  }
  return closed_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), closed);
}

ReceiverStats Receiver::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void Receiver::ReadLoop() {
  const PacketSink sink = [this](wire::Packet&& packet) { HandlePacket(std::move(packet)); };
  ErrorKind reason = ErrorKind::kNone;

  while (!stop_requested_.load(std::memory_order_acquire)) {
    const ReassemblyStateMachine::ReadWindow window = machine_->PrepareRead();
    if (window.data == nullptr) {
      break;
    }

    const ssize_t received = recv(socket_, window.data, window.size, 0);
    if (received > 0) {
      {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.bytes_received += static_cast<uint64_t>(received);
      }
      if (!machine_->CommitRead(static_cast<size_t>(received), sink)) {
        break;
      }
      continue;
    }

    if (received == 0) {
      reason = ErrorKind::kConnectionClosed;
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    if (!stop_requested_.load(std::memory_order_acquire)) {
      std::cerr << "[Receiver] recv failed: " << std::strerror(errno) << std::endl;
      reason = ErrorKind::kIo;
    }
    break;
  }

  FinishConnection(
      machine_->Finish(reason, stop_requested_.load(std::memory_order_acquire)));
}

void Receiver::HandlePacket(wire::Packet&& packet) {
  const wire::PacketHeader header = packet.header;
  const sync::SyncVerdict verdict = synchronizer_.Observe(header.type, header.timestamp_us);
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.packets_received++;
    stats_.packets_by_type[wire::ChannelIndex(header.type)]++;
    if (verdict != sync::SyncVerdict::kInOrder) {
      stats_.clock_anomalies++;
    }
  }

  if (verdict != sync::SyncVerdict::kInOrder && callbacks_.on_clock_anomaly) {
    callbacks_.on_clock_anomaly(header.type, header.timestamp_us, verdict);
  }
  if (callbacks_.on_packet) {
    callbacks_.on_packet(packet, verdict);
  }

  if (header.type == wire::PacketType::kControl) {
    if (header.IsEndOfStream()) {
      std::cout << "[Receiver] End of stream at " << header.timestamp_us << "us" << std::endl;
      {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.end_of_stream = true;
      }
      machine_->Close(ErrorKind::kNone);
    }
    return;
  }

  if (!config_.decode_media) {
    return;
  }

  media::MediaFrame frame;
  if (!DecodeMedia(std::move(packet), &frame)) {
    if (stop_requested_.load(std::memory_order_acquire)) {
      return;
    }
    uint64_t errors = 0;
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      errors = ++stats_.codec_errors;
    }
    if (errors == 1 || errors % kCodecErrorLogInterval == 0) {
      std::cerr << "[Receiver] Dropped undecodable " << wire::PacketTypeToString(header.type)
                << " frame at " << header.timestamp_us << "us (" << errors << " total)"
                << std::endl;
    }
    return;
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_delivered++;
  }
  if (callbacks_.on_frame) {
    callbacks_.on_frame(std::move(frame));
  }
}

bool Receiver::DecodeMedia(wire::Packet&& packet, media::MediaFrame* frame) {
  const wire::PacketHeader& header = packet.header;
  frame->type = header.type;
  frame->timestamp_us = header.timestamp_us;
  frame->flags = header.flags;

  const uint8_t* payload = packet.data();
  const size_t payload_size = packet.size();

  switch (header.type) {
    case wire::PacketType::kVideo: {
      if (!media::DecodeVideoDescriptor(payload, payload_size, &frame->video)) {
        return false;
      }
      const uint8_t* body = payload + media::kVideoDescriptorSize;
      const size_t body_size = payload_size - media::kVideoDescriptorSize;

      if (!header.IsCompressed()) {
        if (body_size != frame->video.raw_size) {
          return false;
        }
        frame->storage = std::move(packet.payload);
        frame->offset = media::kVideoDescriptorSize;
        frame->size = body_size;
        return true;
      }

      // raw_size comes from the peer; check it before reserving pool memory.
      const size_t expected = media::RawFrameSize(frame->video.pixel_format, frame->video.width,
                                                  frame->video.height);
      if (expected == 0 || expected != frame->video.raw_size) {
        return false;
      }
      buffer::PooledBuffer raw = pool_->Acquire(frame->video.raw_size, stop_requested_);
      if (!raw.valid()) {
        return false;
      }
      size_t written = 0;
      const codec::CodecStatus status = codec_->Decompress(
          frame->video, body, body_size, raw.data(), raw.capacity(), &written);
      if (status != codec::CodecStatus::kOk || written != frame->video.raw_size) {
        return false;
      }
      raw.set_size(written);
      frame->storage = std::move(raw);
      frame->offset = 0;
      frame->size = written;
      return true;
    }

    case wire::PacketType::kAudio: {
      if (!media::DecodeAudioDescriptor(payload, payload_size, &frame->audio)) {
        return false;
      }
      const size_t body_size = payload_size - media::kAudioDescriptorSize;
      if (body_size != frame->audio.SampleBytes()) {
        return false;
      }
      frame->storage = std::move(packet.payload);
      frame->offset = media::kAudioDescriptorSize;
      frame->size = body_size;
      return true;
    }

    case wire::PacketType::kMetadata:
      frame->storage = std::move(packet.payload);
      frame->offset = 0;
      frame->size = payload_size;
      return true;

    default:
      return false;
  }
}

void Receiver::FinishConnection(ErrorKind reason) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.connected = false;
    stats_.close_reason = reason;
    std::cout << "[Receiver] Connection closed (" << ErrorKindToString(reason)
              << "), packets=" << stats_.packets_received
              << ", frames=" << stats_.frames_delivered
              << ", codec_errors=" << stats_.codec_errors
              << ", clock_anomalies=" << stats_.clock_anomalies << std::endl;
  }

  if (callbacks_.on_closed) {
    callbacks_.on_closed(reason);
  }

  // WaitForClose() returns only after on_closed has run.
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    running_.store(false, std::memory_order_release);
  }
  closed_cv_.notify_all();
}

}  // namespace aqueduct::receiver
