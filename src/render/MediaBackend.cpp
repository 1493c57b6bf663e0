// Repository: ClipForge-render
// Component: Media Backend
// Purpose: Opens the decoder and encoder the render worker streams frames through.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/MediaBackend.hpp"

#include "clipforge/decode/FFmpegDecoder.h"
#include "clipforge/encode/VideoEncoder.h"

namespace clipforge::render {

std::unique_ptr<FrameSource> FfmpegMediaBackend::OpenSource(const std::string& path,
                                                            util::RationalFps& fps) {
  decode::DecoderConfig config;
  config.input_uri = path;
  auto decoder = std::make_unique<decode::FFmpegDecoder>(config);
  if (!decoder->Open()) {
    return nullptr;
  }
  fps = decoder->GetVideoRationalFps();
  return decoder;
}

std::unique_ptr<FrameSink> FfmpegMediaBackend::OpenSink(const std::string& path,
                                                        const util::RationalFps& fps) {
  encode::VideoEncoderConfig config;
  config.output_path = path;
  config.fps = fps;
  auto encoder = std::make_unique<encode::VideoEncoder>(config);
  if (!encoder->Open()) {
    return nullptr;
  }
  return encoder;
}

bool FfmpegMediaBackend::FinishSink(FrameSink& sink) {
  auto* encoder = dynamic_cast<encode::VideoEncoder*>(&sink);
  return encoder != nullptr && encoder->Close();
}

}  // namespace clipforge::render
