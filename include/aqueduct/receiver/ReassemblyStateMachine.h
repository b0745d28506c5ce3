// Repository: Aqueduct
// Component: Reassembly State Machine
// Purpose: Turns an arbitrarily chunked TCP byte stream into complete packets.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_RECEIVER_REASSEMBLY_STATE_MACHINE_H_
#define AQUEDUCT_RECEIVER_REASSEMBLY_STATE_MACHINE_H_

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/common/ErrorKind.h"
#include "aqueduct/wire/Packet.h"
#include "aqueduct/wire/PacketHeader.h"

namespace aqueduct::receiver {

enum class ReassemblyState {
  kAwaitingHeader,   // Need kHeaderSize bytes
  kAwaitingPayload,  // Header parsed, need header.length more bytes
  kClosed,           // Terminal: stream ended or unrecoverable error
};

const char* ReassemblyStateToString(ReassemblyState state);

// Receives each complete packet. The sink owns the packet once called.
using PacketSink = std::function<void(wire::Packet&& packet)>;

// ReassemblyStateMachine is the per-connection parse state.
//
// State Machine:
//   kAwaitingHeader --(20 bytes)--> kAwaitingPayload --(length bytes)--> emit
//   emit --> kAwaitingHeader
//   any --(decode error / Close())--> kClosed
//
// Input Paths:
// - Feed(): the caller hands over a chunk; bytes are copied into the header
//   area or the packet's pooled payload buffer.
// - PrepareRead()/CommitRead(): the caller reads from the socket directly
//   into the window PrepareRead() returns, so payload bytes land in their
//   final pooled buffer without an intermediate copy.
//
// Guarantees:
// - Output is independent of how the stream was chunked.
// - A header whose length exceeds the limit closes the machine with
//   kProtocolViolation before any payload buffer is requested.
// - An unknown type closes the machine with kMalformedHeader; nothing is
//   emitted for that header.
// - A zero-length payload is emitted immediately with an empty payload.
// - Close() releases any partially filled payload buffer. A closed machine
//   ignores further input.
// - With a `cancel` flag, a payload acquire waiting on a capped pool gives
//   up once the flag is set and the machine closes with kNone.
//
// Not thread-safe: owned by one connection's read thread.
class ReassemblyStateMachine {
 public:
  // Read window for the zero-copy path.
  struct ReadWindow {
    uint8_t* data = nullptr;
    size_t size = 0;
  };

  ReassemblyStateMachine(std::shared_ptr<buffer::BufferPool> pool,
                         uint32_t max_payload_bytes = wire::kDefaultMaxPayloadBytes,
                         const std::atomic<bool>* cancel = nullptr);
  ~ReassemblyStateMachine();

  ReassemblyStateMachine(const ReassemblyStateMachine&) = delete;
  ReassemblyStateMachine& operator=(const ReassemblyStateMachine&) = delete;

  // Consumes `size` bytes and emits every packet they complete.
  // Returns the number of packets emitted by this call.
  size_t Feed(const uint8_t* data, size_t size, const PacketSink& sink);

  // Returns where the next bytes should be written. Empty when closed.
  ReadWindow PrepareRead();

  // Accounts for `bytes` written into the last PrepareRead() window and
  // emits a packet if one completed. Returns false once the machine is closed.
  bool CommitRead(size_t bytes, const PacketSink& sink);

  // Moves to kClosed and releases partial buffers. `reason` is kept only if
  // no earlier error was recorded.
  void Close(ErrorKind reason = ErrorKind::kConnectionClosed);

  // Ends the machine for a connection that stopped reading and returns the
  // connection's close reason. A reason already recorded (protocol error,
  // end-of-stream) wins; otherwise kNone if `cancelled`, else `transport_reason`.
  ErrorKind Finish(ErrorKind transport_reason, bool cancelled);

  ReassemblyState state() const { return state_; }
  ErrorKind close_reason() const { return close_reason_; }

  // True if bytes of an unfinished packet are buffered.
  bool HasPartialPacket() const;

  uint64_t packets_emitted() const { return packets_emitted_; }
  uint64_t bytes_consumed() const { return bytes_consumed_; }

 private:
  // Parses the completed header. Returns false if the machine closed.
  bool OnHeaderComplete(const PacketSink& sink);
  void EmitCurrent(const PacketSink& sink);

  std::shared_ptr<buffer::BufferPool> pool_;
  const uint32_t max_payload_bytes_;
  const std::atomic<bool>* cancel_;

  ReassemblyState state_;
  ErrorKind close_reason_;

  std::array<uint8_t, wire::kHeaderSize> header_bytes_;
  size_t header_filled_;

  wire::PacketHeader current_header_;
  buffer::PooledBuffer payload_;
  size_t payload_filled_;

  uint64_t packets_emitted_;
  uint64_t bytes_consumed_;
};

}  // namespace aqueduct::receiver

#endif  // AQUEDUCT_RECEIVER_REASSEMBLY_STATE_MACHINE_H_
