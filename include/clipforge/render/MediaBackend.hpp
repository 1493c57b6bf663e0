// Repository: ClipForge-render
// Component: Media Backend
// Purpose: Opens the decoder and encoder the render worker streams frames through.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_MEDIA_BACKEND_HPP_
#define CLIPFORGE_RENDER_MEDIA_BACKEND_HPP_

#include <memory>
#include <string>

#include "clipforge/render/FrameIO.hpp"
#include "clipforge/util/RationalFps.hpp"

namespace clipforge::render {

class MediaBackend {
 public:
  virtual ~MediaBackend() = default;

  // Opens |path| for decoding and reports its native frame rate (invalid
  // when unknown). Returns nullptr on failure.
  virtual std::unique_ptr<FrameSource> OpenSource(const std::string& path,
                                                  util::RationalFps& fps) = 0;

  // Opens a silent kOutputWidth x kOutputHeight video file at |fps|.
  // Returns nullptr on failure.
  virtual std::unique_ptr<FrameSink> OpenSink(const std::string& path,
                                              const util::RationalFps& fps) = 0;

  // Flushes and finalizes a sink returned by OpenSink().
  virtual bool FinishSink(FrameSink& sink) = 0;
};

// FFmpegDecoder / VideoEncoder backed implementation.
class FfmpegMediaBackend : public MediaBackend {
 public:
  std::unique_ptr<FrameSource> OpenSource(const std::string& path,
                                          util::RationalFps& fps) override;
  std::unique_ptr<FrameSink> OpenSink(const std::string& path,
                                      const util::RationalFps& fps) override;
  bool FinishSink(FrameSink& sink) override;
};

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_MEDIA_BACKEND_HPP_
