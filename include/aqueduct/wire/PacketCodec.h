// Repository: Aqueduct
// Component: Packet Codec
// Purpose: Stateless transform between packets and their 20-byte framed wire bytes.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_WIRE_PACKET_CODEC_H_
#define AQUEDUCT_WIRE_PACKET_CODEC_H_

#include <cstddef>
#include <cstdint>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/common/ErrorKind.h"
#include "aqueduct/wire/Packet.h"
#include "aqueduct/wire/PacketHeader.h"

namespace aqueduct::wire {

enum class WireStatus {
  kOk = 0,
  kBufferTooSmall,   // Target capacity (or input size) insufficient
  kMalformedHeader,  // Unknown type, or header inconsistent with its payload
  kLengthExceeded,   // Well-formed header whose length exceeds the limit
};

const char* WireStatusToString(WireStatus status);

// Maps a codec failure onto the transport error taxonomy.
// kLengthExceeded is a protocol violation: the peer asked for more than
// the connection allows.
ErrorKind ToErrorKind(WireStatus status);

// Bytes needed to frame `header` (header plus payload).
inline size_t EncodedSize(const PacketHeader& header) {
  return kHeaderSize + header.length;
}

// Writes the 20-byte header into `target`. Used when the payload has already
// been written in place at `target + kHeaderSize`.
WireStatus EncodeHeaderInto(const PacketHeader& header, uint8_t* target,
                            size_t capacity);

// Writes header then payload into caller-supplied space. `header.length`
// must equal `payload_size`. Never allocates and never truncates: on
// kBufferTooSmall nothing is written and *written is 0.
WireStatus EncodeInto(const PacketHeader& header, const uint8_t* payload,
                      size_t payload_size, uint8_t* target, size_t capacity,
                      size_t* written);

// Convenience overload: frames `packet` into `target` and sets its size.
WireStatus EncodeInto(const Packet& packet, buffer::PooledBuffer& target);

// Parses exactly kHeaderSize bytes from `bytes`.
// Returns kBufferTooSmall if fewer bytes are supplied, kMalformedHeader for
// an unknown type, kLengthExceeded if length > max_payload_bytes.
WireStatus DecodeHeader(const uint8_t* bytes, size_t size,
                        uint32_t max_payload_bytes, PacketHeader* header);

}  // namespace aqueduct::wire

#endif  // AQUEDUCT_WIRE_PACKET_CODEC_H_
