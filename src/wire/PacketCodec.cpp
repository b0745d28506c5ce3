// Repository: Aqueduct
// Component: Packet Codec
// Purpose: Stateless transform between packets and their 20-byte framed wire bytes.
// Copyright (c) 2025 RetroVue

#include "aqueduct/wire/PacketCodec.h"

#include <cstring>

#include "aqueduct/wire/ByteOrder.h"

namespace aqueduct::wire {

namespace {

// Field offsets within the header.
constexpr size_t kLengthOffset = 0;
constexpr size_t kTypeOffset = 4;
constexpr size_t kTimestampOffset = 8;
constexpr size_t kFlagsOffset = 16;

}  // namespace

const char* PacketTypeToString(PacketType type) {
  switch (type) {
    case PacketType::kVideo:
      return "video";
    case PacketType::kAudio:
      return "audio";
    case PacketType::kMetadata:
      return "metadata";
    case PacketType::kControl:
      return "control";
    default:
      return "unknown";
  }
}

const char* WireStatusToString(WireStatus status) {
  switch (status) {
    case WireStatus::kOk:
      return "ok";
    case WireStatus::kBufferTooSmall:
      return "buffer_too_small";
    case WireStatus::kMalformedHeader:
      return "malformed_header";
    case WireStatus::kLengthExceeded:
      return "length_exceeded";
    default:
      return "unknown";
  }
}

ErrorKind ToErrorKind(WireStatus status) {
  switch (status) {
    case WireStatus::kOk:
      return ErrorKind::kNone;
    case WireStatus::kBufferTooSmall:
      return ErrorKind::kBufferTooSmall;
    case WireStatus::kMalformedHeader:
      return ErrorKind::kMalformedHeader;
    case WireStatus::kLengthExceeded:
      return ErrorKind::kProtocolViolation;
    default:
      return ErrorKind::kProtocolViolation;
  }
}

WireStatus EncodeHeaderInto(const PacketHeader& header, uint8_t* target,
                            size_t capacity) {
  if (!IsKnownPacketType(static_cast<uint32_t>(header.type))) {
    return WireStatus::kMalformedHeader;
  }
  if (target == nullptr || capacity < kHeaderSize) {
    return WireStatus::kBufferTooSmall;
  }

  StoreU32BE(target + kLengthOffset, header.length);
  StoreU32BE(target + kTypeOffset, static_cast<uint32_t>(header.type));
  StoreU64BE(target + kTimestampOffset, header.timestamp_us);
  StoreU32BE(target + kFlagsOffset, header.flags);
  return WireStatus::kOk;
}

WireStatus EncodeInto(const PacketHeader& header, const uint8_t* payload,
                      size_t payload_size, uint8_t* target, size_t capacity,
                      size_t* written) {
  if (written) {
    *written = 0;
  }
  if (static_cast<size_t>(header.length) != payload_size ||
      (payload == nullptr && payload_size != 0)) {
    return WireStatus::kMalformedHeader;
  }
  if (capacity < kHeaderSize + payload_size) {
    return WireStatus::kBufferTooSmall;
  }

  const WireStatus status = EncodeHeaderInto(header, target, capacity);
  if (status != WireStatus::kOk) {
    return status;
  }
  if (payload_size > 0) {
    std::memcpy(target + kHeaderSize, payload, payload_size);
  }
  if (written) {
    *written = kHeaderSize + payload_size;
  }
  return WireStatus::kOk;
}

WireStatus EncodeInto(const Packet& packet, buffer::PooledBuffer& target) {
  if (!target.valid()) {
    return WireStatus::kBufferTooSmall;
  }
  size_t written = 0;
  const WireStatus status =
      EncodeInto(packet.header, packet.payload.data(), packet.payload.size(),
                 target.data(), target.capacity(), &written);
  if (status == WireStatus::kOk) {
    target.set_size(written);
  }
  return status;
}

WireStatus DecodeHeader(const uint8_t* bytes, size_t size,
                        uint32_t max_payload_bytes, PacketHeader* header) {
  if (bytes == nullptr || size < kHeaderSize) {
    return WireStatus::kBufferTooSmall;
  }

  const uint32_t raw_type = LoadU32BE(bytes + kTypeOffset);
  if (!IsKnownPacketType(raw_type)) {
    return WireStatus::kMalformedHeader;
  }

  const uint32_t length = LoadU32BE(bytes + kLengthOffset);
  if (length > max_payload_bytes) {
    return WireStatus::kLengthExceeded;
  }

  if (header) {
    header->length = length;
    header->type = static_cast<PacketType>(raw_type);
    header->timestamp_us = LoadU64BE(bytes + kTimestampOffset);
    header->flags = LoadU32BE(bytes + kFlagsOffset);
  }
  return WireStatus::kOk;
}

}  // namespace aqueduct::wire
