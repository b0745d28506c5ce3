// Repository: Aqueduct
// Component: Reassembly State Machine
// Purpose: Turns an arbitrarily chunked TCP byte stream into complete packets.
// Copyright (c) 2025 RetroVue

#include "aqueduct/receiver/ReassemblyStateMachine.h"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <utility>

#include "aqueduct/wire/PacketCodec.h"

namespace aqueduct::receiver {

const char* ReassemblyStateToString(ReassemblyState state) {
  switch (state) {
    case ReassemblyState::kAwaitingHeader:
      return "awaiting_header";
    case ReassemblyState::kAwaitingPayload:
      return "awaiting_payload";
    case ReassemblyState::kClosed:
      return "closed";
    default:
      return "unknown";
  }
}

ReassemblyStateMachine::ReassemblyStateMachine(std::shared_ptr<buffer::BufferPool> pool,
                                               uint32_t max_payload_bytes,
                                               const std::atomic<bool>* cancel)
    : pool_(std::move(pool)),
      max_payload_bytes_(max_payload_bytes),
      cancel_(cancel),
      state_(ReassemblyState::kAwaitingHeader),
      close_reason_(ErrorKind::kNone),
      header_bytes_{},
      header_filled_(0),
      payload_filled_(0),
      packets_emitted_(0),
      bytes_consumed_(0) {}

ReassemblyStateMachine::~ReassemblyStateMachine() = default;

size_t ReassemblyStateMachine::Feed(const uint8_t* data, size_t size, const PacketSink& sink) {
  size_t emitted = 0;

  while (size > 0 && state_ != ReassemblyState::kClosed) {
    const ReadWindow window = PrepareRead();
    if (window.data == nullptr) {
      break;
    }
    const size_t n = std::min(size, window.size);
    std::memcpy(window.data, data, n);
    data += n;
    size -= n;

    const uint64_t before = packets_emitted_;
    CommitRead(n, sink);
    emitted += static_cast<size_t>(packets_emitted_ - before);
  }
  return emitted;
}

ReassemblyStateMachine::ReadWindow ReassemblyStateMachine::PrepareRead() {
  ReadWindow window;
  switch (state_) {
    case ReassemblyState::kAwaitingHeader:
      window.data = header_bytes_.data() + header_filled_;
      window.size = wire::kHeaderSize - header_filled_;
      break;
    case ReassemblyState::kAwaitingPayload:
      window.data = payload_.data() + payload_filled_;
      window.size = current_header_.length - payload_filled_;
      break;
    case ReassemblyState::kClosed:
    default:
      break;
  }
  return window;
}

bool ReassemblyStateMachine::CommitRead(size_t bytes, const PacketSink& sink) {
  if (state_ == ReassemblyState::kClosed) {
    return false;
  }
  bytes_consumed_ += bytes;

  if (state_ == ReassemblyState::kAwaitingHeader) {
    header_filled_ = std::min(wire::kHeaderSize, header_filled_ + bytes);
    if (header_filled_ == wire::kHeaderSize) {
      return OnHeaderComplete(sink);
    }
    return true;
  }

  payload_filled_ = std::min<size_t>(current_header_.length, payload_filled_ + bytes);
  if (payload_filled_ == current_header_.length) {
    EmitCurrent(sink);
  }
  return state_ != ReassemblyState::kClosed;
}

bool ReassemblyStateMachine::OnHeaderComplete(const PacketSink& sink) {
  wire::PacketHeader header;
  const wire::WireStatus status =
      wire::DecodeHeader(header_bytes_.data(), header_bytes_.size(), max_payload_bytes_, &header);
  if (status != wire::WireStatus::kOk) {
    std::cerr << "[Reassembly] Rejecting header: " << wire::WireStatusToString(status)
              << std::endl;
    Close(wire::ToErrorKind(status));
    return false;
  }

  current_header_ = header;
  payload_filled_ = 0;

  if (header.length == 0) {
    EmitCurrent(sink);
    return state_ != ReassemblyState::kClosed;
  }

  if (pool_) {
    payload_ = cancel_ ? pool_->Acquire(header.length, *cancel_) : pool_->Acquire(header.length);
  }
  if (!payload_.valid()) {
    if (cancel_ && cancel_->load(std::memory_order_acquire)) {
      Close(ErrorKind::kNone);
      return false;
    }
    std::cerr << "[Reassembly] No buffer for " << header.length << "-byte payload" << std::endl;
    Close(ErrorKind::kBufferTooSmall);
    return false;
  }

  state_ = ReassemblyState::kAwaitingPayload;
  return true;
}

void ReassemblyStateMachine::EmitCurrent(const PacketSink& sink) {
  payload_.set_size(current_header_.length);
  wire::Packet packet(current_header_, std::move(payload_));

  // Ready for the next header before the sink runs; the sink may Close().
  state_ = ReassemblyState::kAwaitingHeader;
  header_filled_ = 0;
  payload_filled_ = 0;
  packets_emitted_++;

  if (sink) {
    sink(std::move(packet));
  }
}

void ReassemblyStateMachine::Close(ErrorKind reason) {
  if (state_ != ReassemblyState::kClosed && close_reason_ == ErrorKind::kNone) {
    close_reason_ = reason;
  }
  state_ = ReassemblyState::kClosed;
  payload_.Reset();
  header_filled_ = 0;
  payload_filled_ = 0;
}

ErrorKind ReassemblyStateMachine::Finish(ErrorKind transport_reason, bool cancelled) {
  if (state_ != ReassemblyState::kClosed) {
    Close(cancelled ? ErrorKind::kNone : transport_reason);
  }
  return close_reason_;
}

bool ReassemblyStateMachine::HasPartialPacket() const {
  return (state_ == ReassemblyState::kAwaitingHeader && header_filled_ > 0) ||
         state_ == ReassemblyState::kAwaitingPayload;
}

}  // namespace aqueduct::receiver
