// Repository: Aqueduct
// Component: Packet Header
// Purpose: Fixed 20-byte packet header shared by sender and receiver.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_WIRE_PACKET_HEADER_H_
#define AQUEDUCT_WIRE_PACKET_HEADER_H_

#include <cstddef>
#include <cstdint>

namespace aqueduct::wire {

// Channel carried by a packet. Numeric values are the on-wire enumerants.
enum class PacketType : uint32_t {
  kVideo = 1,
  kAudio = 2,
  kMetadata = 3,
  kControl = 4,
};

// Flag bits carried in PacketHeader::flags.
namespace flags {
constexpr uint32_t kKeyFrame = 0x1;
constexpr uint32_t kEndOfStream = 0x2;
constexpr uint32_t kCompressed = 0x4;
}  // namespace flags

// Wire layout (all fields big-endian):
//   length:u32 | type:u32 | timestamp:u64 | flags:u32
// followed immediately by `length` payload bytes.
constexpr size_t kHeaderSize = 20;

// Default ceiling for a single payload (64 MiB). Large enough for an
// uncompressed 4K BGRA frame plus descriptor.
constexpr uint32_t kDefaultMaxPayloadBytes = 64u * 1024u * 1024u;

// Number of distinct channel types (array sizing for per-channel state).
constexpr size_t kChannelCount = 4;

struct PacketHeader {
  uint32_t length = 0;                     // Payload bytes, header excluded
  PacketType type = PacketType::kControl;  // Channel
  uint64_t timestamp_us = 0;               // Sender session clock, microseconds
  uint32_t flags = 0;                      // flags::* bitset

  bool HasFlag(uint32_t flag) const { return (flags & flag) != 0; }
  bool IsKeyFrame() const { return HasFlag(flags::kKeyFrame); }
  bool IsEndOfStream() const { return HasFlag(flags::kEndOfStream); }
  bool IsCompressed() const { return HasFlag(flags::kCompressed); }

  bool operator==(const PacketHeader& other) const {
    return length == other.length && type == other.type &&
           timestamp_us == other.timestamp_us && flags == other.flags;
  }
  bool operator!=(const PacketHeader& other) const { return !(*this == other); }
};

// Returns true if `raw` is one of the known PacketType enumerants.
inline bool IsKnownPacketType(uint32_t raw) {
  return raw >= static_cast<uint32_t>(PacketType::kVideo) &&
         raw <= static_cast<uint32_t>(PacketType::kControl);
}

// Zero-based index for per-channel arrays.
inline size_t ChannelIndex(PacketType type) {
  return static_cast<size_t>(type) - 1;
}

const char* PacketTypeToString(PacketType type);

}  // namespace aqueduct::wire

#endif  // AQUEDUCT_WIRE_PACKET_HEADER_H_
