// Repository: Aqueduct
// Component: Byte Order Helpers
// Purpose: Big-endian load/store helpers shared by the wire and media codecs.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_WIRE_BYTE_ORDER_H_
#define AQUEDUCT_WIRE_BYTE_ORDER_H_

#include <cstdint>

namespace aqueduct::wire {

inline void StoreU32BE(uint8_t* dst, uint32_t value) {
  dst[0] = static_cast<uint8_t>(value >> 24);
  dst[1] = static_cast<uint8_t>(value >> 16);
  dst[2] = static_cast<uint8_t>(value >> 8);
  dst[3] = static_cast<uint8_t>(value);
}

inline void StoreU64BE(uint8_t* dst, uint64_t value) {
  StoreU32BE(dst, static_cast<uint32_t>(value >> 32));
  StoreU32BE(dst + 4, static_cast<uint32_t>(value));
}

inline uint32_t LoadU32BE(const uint8_t* src) {
  return (static_cast<uint32_t>(src[0]) << 24) |
         (static_cast<uint32_t>(src[1]) << 16) |
         (static_cast<uint32_t>(src[2]) << 8) |
         static_cast<uint32_t>(src[3]);
}

inline uint64_t LoadU64BE(const uint8_t* src) {
  return (static_cast<uint64_t>(LoadU32BE(src)) << 32) | LoadU32BE(src + 4);
}

}  // namespace aqueduct::wire

#endif  // AQUEDUCT_WIRE_BYTE_ORDER_H_
