// Repository: Aqueduct
// Component: Sender Connection
// Purpose: One accepted receiver socket with its bounded queue and writer thread.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_SENDER_CONNECTION_H_
#define AQUEDUCT_SENDER_CONNECTION_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "aqueduct/buffer/PacketQueue.h"

namespace aqueduct::sender {

struct ConnectionInfo {
  uint64_t id = 0;
  std::string peer;  // "address:port"
  uint64_t packets_sent = 0;
  uint64_t bytes_sent = 0;
  size_t queued_packets = 0;
  size_t queued_bytes = 0;
  size_t high_water_bytes = 0;
  uint64_t packets_dropped = 0;
  bool open = false;
};

// Connection owns one receiver socket.
//
// Lifecycle:
// - Start() launches the writer thread, which pops packets and writes them
//   in full, in queue order.
// - A write failure closes this connection only: the queue is closed (so
//   blocked producers return), the socket is shut down and IsOpen() turns
//   false. The sender reaps it later.
// - Drain() lets the writer finish what is queued, bounded by a timeout.
// - Close() stops immediately and discards pending packets.
class Connection {
 public:
  Connection(uint64_t id, int socket, std::string peer, size_t queue_capacity,
             buffer::OverloadPolicy policy);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  void Start();

  // Queues `packet` for this receiver. timeout_us < 0 waits indefinitely.
  buffer::PushResult Enqueue(const buffer::OutboundPacket& packet, int64_t timeout_us);

  // Stops accepting packets and waits up to `timeout_us` for the writer to
  // flush the queue. Returns true if everything was written.
  bool Drain(int64_t timeout_us);

  void Close();

  bool IsOpen() const { return open_.load(std::memory_order_acquire); }
  uint64_t id() const { return id_; }
  const std::string& peer() const { return peer_; }

  ConnectionInfo Info() const;

 private:
  void WriterLoop();
  bool SendAll(const uint8_t* data, size_t size);

  const uint64_t id_;
  int socket_;
  const std::string peer_;
  buffer::PacketQueue queue_;

  std::atomic<bool> open_;
  std::atomic<uint64_t> packets_sent_;
  std::atomic<uint64_t> bytes_sent_;

  std::mutex close_mutex_;
  std::unique_ptr<std::thread> writer_thread_;
  std::mutex writer_mutex_;
  std::condition_variable writer_done_cv_;
  bool writer_done_ = false;
};

}  // namespace aqueduct::sender

#endif  // AQUEDUCT_SENDER_CONNECTION_H_
