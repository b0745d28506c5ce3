// Repository: Aqueduct
// Component: Error Taxonomy
// Purpose: Error kinds reported by the transport core and its collaborators.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_COMMON_ERROR_KIND_H_
#define AQUEDUCT_COMMON_ERROR_KIND_H_

namespace aqueduct {

// ErrorKind classifies every failure the transport can surface.
//
// Scope:
// - kMalformedHeader / kProtocolViolation: fatal for the connection only.
// - kBufferTooSmall: caller or configuration bug, never truncated silently.
// - kCodecError: fatal for one frame; the connection continues.
// - kClockAnomaly: advisory, the packet is still delivered.
// - kConnectionClosed / kIo: end that connection's tasks only.
// - kConfig: invalid port or pool sizing, fatal at startup.
enum class ErrorKind {
  kNone = 0,
  kMalformedHeader,
  kProtocolViolation,
  kBufferTooSmall,
  kCodecError,
  kClockAnomaly,
  kConnectionClosed,
  kIo,
  kConfig,
};

const char* ErrorKindToString(ErrorKind kind);

}  // namespace aqueduct

#endif  // AQUEDUCT_COMMON_ERROR_KIND_H_
