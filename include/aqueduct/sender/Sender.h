// Repository: Aqueduct
// Component: Sender
// Purpose: Accepts receivers and fans stamped, compressed, framed media out to all of them.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_SENDER_SENDER_H_
#define AQUEDUCT_SENDER_SENDER_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/buffer/PacketQueue.h"
#include "aqueduct/capture/ICaptureSource.h"
#include "aqueduct/codec/ICodec.h"
#include "aqueduct/discovery/IDiscovery.h"
#include "aqueduct/media/MediaFrame.h"
#include "aqueduct/sender/Connection.h"
#include "aqueduct/sync/StreamSynchronizer.h"
#include "aqueduct/timing/MasterClock.h"
#include "aqueduct/wire/PacketHeader.h"

namespace aqueduct::sender {

struct SenderConfig {
  // Advertised through discovery.
  std::string name = "aqueduct";

  // IPv4 address to listen on.
  std::string bind_host = "0.0.0.0";

  // TCP port. 0 binds an ephemeral port; see Sender::GetPort().
  uint16_t port = 6400;

  // Packets held per connection before backpressure applies.
  size_t queue_capacity = 16;
  buffer::OverloadPolicy overload_policy = buffer::OverloadPolicy::kBlock;

  // Largest payload the sender will frame. Must fit the pool's
  // max_buffer_bytes together with the header.
  uint32_t max_payload_bytes = wire::kDefaultMaxPayloadBytes;

  // Connections beyond this are refused.
  size_t max_connections = 32;

  // Bound on Stop() waiting for queues to flush.
  int64_t drain_timeout_ms = 1000;

  bool advertise = true;

  // SO_SNDBUF hint (0 = OS default).
  int send_buffer_bytes = 0;
};

struct SenderStats {
  uint64_t frames_submitted = 0;
  uint64_t frames_sent = 0;          // Frames framed and handed to the fan-out
  uint64_t frames_without_peers = 0; // Framed while no receiver was connected
  uint64_t frames_rejected = 0;      // Invalid frames (bad descriptor, oversize)
  uint64_t codec_errors = 0;
  uint64_t frames_compressed = 0;
  uint64_t packets_enqueued = 0;     // Sum over connections
  uint64_t connections_accepted = 0;
  uint64_t connections_refused = 0;
  uint64_t connections_closed = 0;
  size_t active_connections = 0;
  uint64_t bytes_sent = 0;           // Includes closed connections
  uint64_t packets_dropped = 0;      // By kDropOldest, includes closed connections
};

// Sender is one published source.
//
// Pipeline (caller or intake thread):
//   SubmitFrame -> SenderClock stamp -> compress video (codec) -> frame the
//   packet -> one SharedBuffer queued on every open connection
//
// Threads:
// - Accept thread: accepts receivers, reaps closed connections.
// - One writer thread per connection (see Connection).
// - One intake thread per attached capture source.
//
// Zero-copy:
// - Uncompressed payloads are framed in place when the frame leaves
//   media::kFrameHeadroom bytes in front of its content. The same block
//   then travels from capture to every socket.
//
// Failure Isolation:
// - A connection whose write fails is closed and reaped; others continue.
// - A frame the codec cannot compress is dropped and counted.
class Sender {
 public:
  Sender(const SenderConfig& config,
         std::shared_ptr<buffer::BufferPool> pool,
         std::unique_ptr<codec::ICodec> codec,
         std::shared_ptr<timing::MasterClock> clock = nullptr,
         discovery::IDiscovery* discovery = nullptr);
  ~Sender();

  Sender(const Sender&) = delete;
  Sender& operator=(const Sender&) = delete;

  // Validates the configuration, listens, advertises and starts accepting.
  // Returns false (and logs) on an invalid configuration or bind failure.
  bool Start();

  // Stops intake, sends a best-effort end-of-stream packet, waits up to
  // drain_timeout_ms for queues to flush, then closes every connection.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Bound port, valid after Start().
  uint16_t GetPort() const { return bound_port_; }

  // Stamps, encodes and fans out one frame. Blocks while a connection queue
  // is full under kBlock. Returns false if the frame was dropped or the
  // sender is not running. The frame's timestamp is overwritten.
  bool SubmitFrame(media::MediaFrame&& frame);

  // Pulls frames from `source` on a dedicated thread until it is exhausted
  // or the sender stops.
  bool AttachSource(std::unique_ptr<capture::ICaptureSource> source);

  // Waits until every attached source is exhausted. timeout_ms < 0 waits
  // forever. Returns true if none is active.
  bool WaitForSources(int64_t timeout_ms = -1);

  std::vector<ConnectionInfo> ListConnections() const;
  size_t ConnectionCount() const;

  // Closes one connection. Returns false if `id` is unknown.
  bool CloseConnection(uint64_t id);

  SenderStats GetStats() const;

  const SenderConfig& config() const { return config_; }
  const std::string& codec_name() const { return codec_name_; }

 private:
  struct AttachedSource {
    std::unique_ptr<capture::ICaptureSource> source;
    std::unique_ptr<std::thread> thread;
  };

  bool ValidateConfig() const;
  bool OpenListenSocket();
  void AcceptLoop();
  void IntakeLoop(capture::ICaptureSource* source);

  // Produces the framed packet for `frame`. Returns false if the frame must
  // be dropped.
  bool BuildPacket(media::MediaFrame& frame, buffer::OutboundPacket* packet);

  // Frames `frame` without compression, in place when headroom allows.
  bool FrameUncompressed(media::MediaFrame& frame, const uint8_t* descriptor,
                         size_t descriptor_size, uint32_t flags,
                         buffer::OutboundPacket* packet);

  bool FrameCompressedVideo(media::MediaFrame& frame, buffer::OutboundPacket* packet);

  // Queues `packet` on every open connection. Gives up on a connection once
  // `deadline_us` (monotonic) passes, or when the sender is stopping if
  // `deadline_us` is negative.
  size_t FanOut(const buffer::OutboundPacket& packet, int64_t deadline_us);

  void ReapClosedConnections();
  void RetireConnection(const std::shared_ptr<Connection>& connection);

  const SenderConfig config_;
  std::shared_ptr<buffer::BufferPool> pool_;
  std::unique_ptr<codec::ICodec> codec_;
  std::string codec_name_;
  std::shared_ptr<timing::MasterClock> clock_;
  discovery::IDiscovery* discovery_;
  sync::SenderClock sender_clock_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;

  int listen_socket_;
  uint16_t bound_port_;
  std::unique_ptr<std::thread> accept_thread_;

  // Serializes SubmitFrame(): the codec is single-threaded, and stamping
  // and enqueueing under one lock keeps per-connection order equal to
  // timestamp order.
  std::mutex submit_mutex_;

  mutable std::mutex connections_mutex_;
  std::vector<std::shared_ptr<Connection>> connections_;
  uint64_t next_connection_id_;

  std::mutex sources_mutex_;
  std::condition_variable sources_cv_;
  std::vector<AttachedSource> sources_;
  size_t active_sources_;

  mutable std::mutex stats_mutex_;
  SenderStats stats_;
};

}  // namespace aqueduct::sender

#endif  // AQUEDUCT_SENDER_SENDER_H_
