// Repository: Aqueduct
// Component: Sender Connection
// Purpose: One accepted receiver socket with its bounded queue and writer thread.
// Copyright (c) 2025 RetroVue

#include "aqueduct/sender/Connection.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

#define INVALID_SOCKET -1
#define CLOSE_SOCKET close

namespace aqueduct::sender {

Connection::Connection(uint64_t id, int socket, std::string peer, size_t queue_capacity,
                       buffer::OverloadPolicy policy)
    : id_(id),
      socket_(socket),
      peer_(std::move(peer)),
      queue_(queue_capacity, policy),
      open_(socket != INVALID_SOCKET),
      packets_sent_(0),
      bytes_sent_(0) {}

Connection::~Connection() {
  Close();
}

void Connection::Start() {
  if (writer_thread_) {
    return;
  }
  writer_thread_ = std::make_unique<std::thread>(&Connection::WriterLoop, this);
}

buffer::PushResult Connection::Enqueue(const buffer::OutboundPacket& packet,
                                       int64_t timeout_us) {
  if (!IsOpen()) {
    return buffer::PushResult::kClosed;
  }
  return queue_.Push(packet, timeout_us);
}

void Connection::WriterLoop() {
  buffer::OutboundPacket packet;
  while (queue_.Pop(packet)) {
    if (!SendAll(packet.data(), packet.size)) {
      std::cerr << "[Connection " << id_ << "] Write to " << peer_
                << " failed: " << std::strerror(errno) << std::endl;
      open_.store(false, std::memory_order_release);
      queue_.Close(true);
      shutdown(socket_, SHUT_RDWR);
      break;
    }
    packets_sent_.fetch_add(1, std::memory_order_relaxed);
    bytes_sent_.fetch_add(packet.size, std::memory_order_relaxed);
    packet = buffer::OutboundPacket();
  }

  {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    writer_done_ = true;
  }
  writer_done_cv_.notify_all();
}

bool Connection::SendAll(const uint8_t* data, size_t size) {
  while (size > 0) {
    const ssize_t sent = send(socket_, data, size, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += sent;
    size -= static_cast<size_t>(sent);
  }
  return true;
}

bool Connection::Drain(int64_t timeout_us) {
  queue_.Close(false);
  if (!writer_thread_) {
    return queue_.Size() == 0;
  }
  std::unique_lock<std::mutex> lock(writer_mutex_);
  const bool done = writer_done_cv_.wait_for(lock, std::chrono::microseconds(timeout_us),
                                             [this] { return writer_done_; });
  return done && IsOpen();
}

void Connection::Close() {
  std::lock_guard<std::mutex> close_lock(close_mutex_);
  if (socket_ == INVALID_SOCKET) {
    return;
  }

  open_.store(false, std::memory_order_release);
  queue_.Close(true);

  // Unblocks a writer stuck in send() on a slow peer.
  shutdown(socket_, SHUT_RDWR);
  if (writer_thread_ && writer_thread_->joinable()) {
    writer_thread_->join();
  }
  writer_thread_.reset();

  CLOSE_SOCKET(socket_);
  socket_ = INVALID_SOCKET;

  std::cout << "[Connection " << id_ << "] Closed " << peer_ << " (sent "
            << packets_sent_.load(std::memory_order_relaxed) << " packets, "
            << bytes_sent_.load(std::memory_order_relaxed) << " bytes)" << std::endl;
}

ConnectionInfo Connection::Info() const {
  ConnectionInfo info;
  info.id = id_;
  info.peer = peer_;
  info.packets_sent = packets_sent_.load(std::memory_order_relaxed);
  info.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);
  info.queued_packets = queue_.Size();
  info.queued_bytes = queue_.Bytes();
  info.high_water_bytes = queue_.HighWaterBytes();
  info.packets_dropped = queue_.Dropped();
  info.open = IsOpen();
  return info;
}

}  // namespace aqueduct::sender
