// Repository: ClipForge-render
// Component: Frame I/O Interfaces
// Purpose: Source/sink seams between the frame loop and the codec layer.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_FRAME_IO_HPP_
#define CLIPFORGE_RENDER_FRAME_IO_HPP_

#include "clipforge/render/Image.hpp"

namespace clipforge::render {

// FrameSource yields decoded frames at native resolution, in order.
class FrameSource {
 public:
  virtual ~FrameSource() = default;

  // Fills |out| with the next frame. Returns false on a decode failure or at
  // end of stream; the caller decides whether to stop or repeat.
  virtual bool ReadFrame(RgbFrame& out) = 0;
};

// FrameSink accepts finished kOutputWidth x kOutputHeight frames.
class FrameSink {
 public:
  virtual ~FrameSink() = default;

  // Returns false if the frame could not be written.
  virtual bool WriteFrame(const RgbFrame& frame) = 0;
};

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_FRAME_IO_HPP_
