// Repository: Aqueduct
// Component: Error Taxonomy
// Purpose: Error kinds reported by the transport core and its collaborators.
// Copyright (c) 2025 RetroVue

#include "aqueduct/common/ErrorKind.h"

namespace aqueduct {

const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kMalformedHeader:
      return "malformed_header";
    case ErrorKind::kProtocolViolation:
      return "protocol_violation";
    case ErrorKind::kBufferTooSmall:
      return "buffer_too_small";
    case ErrorKind::kCodecError:
      return "codec_error";
    case ErrorKind::kClockAnomaly:
      return "clock_anomaly";
    case ErrorKind::kConnectionClosed:
      return "connection_closed";
    case ErrorKind::kIo:
      return "io";
    case ErrorKind::kConfig:
      return "config";
    default:
      return "unknown";
  }
}

}  // namespace aqueduct
