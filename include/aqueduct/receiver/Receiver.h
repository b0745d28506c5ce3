// Repository: Aqueduct
// Component: Receiver
// Purpose: One TCP connection to a sender: reassembly, sync validation and media decode.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_RECEIVER_RECEIVER_H_
#define AQUEDUCT_RECEIVER_RECEIVER_H_

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/codec/ICodec.h"
#include "aqueduct/common/ErrorKind.h"
#include "aqueduct/discovery/IDiscovery.h"
#include "aqueduct/media/MediaFrame.h"
#include "aqueduct/receiver/ReassemblyStateMachine.h"
#include "aqueduct/sync/StreamSynchronizer.h"
#include "aqueduct/wire/Packet.h"
#include "aqueduct/wire/PacketHeader.h"

namespace aqueduct::receiver {

struct ReceiverConfig {
  std::string name = "aqueduct-receiver";

  // Headers announcing more than this close the connection.
  uint32_t max_payload_bytes = wire::kDefaultMaxPayloadBytes;

  // Cross-channel skew reported as an anomaly (0 = disabled).
  uint64_t max_skew_us = 0;

  // Parse descriptors and decompress video into MediaFrames for on_frame.
  bool decode_media = true;

  // SO_RCVBUF hint (0 = OS default).
  int receive_buffer_bytes = 0;
};

struct ReceiverStats {
  uint64_t packets_received = 0;
  uint64_t bytes_received = 0;  // Header and payload bytes
  std::array<uint64_t, wire::kChannelCount> packets_by_type{};
  uint64_t frames_delivered = 0;
  uint64_t codec_errors = 0;
  uint64_t clock_anomalies = 0;
  bool connected = false;
  bool end_of_stream = false;
  ErrorKind close_reason = ErrorKind::kNone;
};

// All callbacks run on the receiver's read thread, in packet order. They
// must not call Close() on the same receiver.
struct ReceiverCallbacks {
  // Every packet, before media decode. `verdict` is advisory.
  std::function<void(const wire::Packet& packet, sync::SyncVerdict verdict)> on_packet;

  // Decoded video, audio and metadata. Control packets are not delivered.
  std::function<void(media::MediaFrame&& frame)> on_frame;

  std::function<void(wire::PacketType type, uint64_t timestamp_us, sync::SyncVerdict verdict)>
      on_clock_anomaly;

  // Exactly once per connection. kNone for end-of-stream or a local Close(),
  // unless a protocol error was already recorded.
  std::function<void(ErrorKind reason)> on_closed;
};

// Receiver reads one sender's stream.
//
// Pipeline (read thread):
//   recv() into ReassemblyStateMachine window -> Packet
//   -> ReceiverSynchronizer (advisory) -> on_packet
//   -> media decode (decompress when kCompressed) -> on_frame
//
// Error Handling:
// - A frame that fails to decode is dropped and counted; the stream goes on.
// - Malformed headers, protocol violations and I/O errors end the
//   connection with that reason.
// - A Control packet carrying kEndOfStream ends the connection cleanly.
//
// Reconnection is not attempted. Connect() may be called again after the
// previous connection has closed.
class Receiver {
 public:
  Receiver(const ReceiverConfig& config,
           std::shared_ptr<buffer::BufferPool> pool,
           std::unique_ptr<codec::ICodec> codec,
           ReceiverCallbacks callbacks);
  ~Receiver();

  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  // Opens a TCP connection and starts the read thread.
  bool Connect(const std::string& host, uint16_t port);
  bool Connect(const discovery::SenderRecord& record);

  // Cancels the read thread and releases every buffer it held. Also ends a
  // wait for pool capacity on the read thread.
  void Close();

  // Waits until the connection has closed. timeout_ms < 0 waits forever.
  // Returns true if closed.
  bool WaitForClose(int64_t timeout_ms = -1);

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  ReceiverStats GetStats() const;

  const ReceiverConfig& config() const { return config_; }

 private:
  void ReadLoop();
  void HandlePacket(wire::Packet&& packet);

  // Builds a MediaFrame from a video, audio or metadata packet. Returns false
  // (and counts a codec error) if the payload cannot be decoded.
  bool DecodeMedia(wire::Packet&& packet, media::MediaFrame* frame);

  void FinishConnection(ErrorKind reason);

  const ReceiverConfig config_;
  std::shared_ptr<buffer::BufferPool> pool_;
  std::unique_ptr<codec::ICodec> codec_;
  ReceiverCallbacks callbacks_;

  int socket_;
  std::unique_ptr<ReassemblyStateMachine> machine_;
  sync::ReceiverSynchronizer synchronizer_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  std::unique_ptr<std::thread> read_thread_;

  mutable std::mutex stats_mutex_;
  std::condition_variable closed_cv_;
  ReceiverStats stats_;
};

}  // namespace aqueduct::receiver

#endif  // AQUEDUCT_RECEIVER_RECEIVER_H_
