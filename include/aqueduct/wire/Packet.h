// Repository: Aqueduct
// Component: Packet
// Purpose: Header plus exclusively owned pooled payload.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_WIRE_PACKET_H_
#define AQUEDUCT_WIRE_PACKET_H_

#include <utility>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/wire/PacketHeader.h"

namespace aqueduct::wire {

// Packet owns its payload exclusively. It is move-only; ownership moves
// between pipeline stages and the payload returns to the pool when the last
// holder drops it.
struct Packet {
  PacketHeader header;
  buffer::PooledBuffer payload;  // payload.size() == header.length

  Packet() = default;
  Packet(const PacketHeader& h, buffer::PooledBuffer p)
      : header(h), payload(std::move(p)) {}

  Packet(Packet&&) = default;
  Packet& operator=(Packet&&) = default;
  Packet(const Packet&) = delete;
  Packet& operator=(const Packet&) = delete;

  const uint8_t* data() const { return payload.data(); }
  size_t size() const { return payload.size(); }
};

}  // namespace aqueduct::wire

#endif  // AQUEDUCT_WIRE_PACKET_H_
