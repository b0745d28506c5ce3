// Repository: Aqueduct
// Component: Capture Source Interface
// Purpose: Lazy producer of media frames consumed by the sender intake.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_CAPTURE_I_CAPTURE_SOURCE_H_
#define AQUEDUCT_CAPTURE_I_CAPTURE_SOURCE_H_

#include "aqueduct/media/MediaFrame.h"

namespace aqueduct::capture {

// ICaptureSource yields frames one at a time. A source may be infinite and
// is not restartable: once Next() returns false it stays exhausted.
//
// Frames should leave media::kFrameHeadroom bytes in front of their content
// so the sender can frame them in place.
class ICaptureSource {
 public:
  virtual ~ICaptureSource() = default;

  virtual const char* Name() const = 0;

  // Fills `frame` with the next unit of media, blocking as needed to pace
  // output. Returns false when the source is exhausted or stopped.
  virtual bool Next(media::MediaFrame& frame) = 0;

  // Makes a blocked or future Next() return false. Callable from any thread.
  virtual void Stop() = 0;
};

}  // namespace aqueduct::capture

#endif  // AQUEDUCT_CAPTURE_I_CAPTURE_SOURCE_H_
