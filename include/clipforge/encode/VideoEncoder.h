// Repository: ClipForge-render
// Component: Video Encoder
// Purpose: Encodes finished RGB24 frames into a silent MP4 file.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_ENCODE_VIDEO_ENCODER_H_
#define CLIPFORGE_ENCODE_VIDEO_ENCODER_H_

#include <cstdint>
#include <string>

#include "clipforge/render/FrameIO.hpp"
#include "clipforge/util/RationalFps.hpp"

struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace clipforge::encode {

struct VideoEncoderConfig {
  std::string output_path;
  util::RationalFps fps{30, 1};
  int width = render::kOutputWidth;
  int height = render::kOutputHeight;
  int crf = 20;                     // libx264 quality
  int64_t fallback_bitrate = 8000000;  // mpeg4 when libx264 is unavailable
  int gop_size = 60;
};

// VideoEncoder writes a video-only MP4. libx264 is preferred; the built-in
// mpeg4 encoder is used when libx264 is not compiled in.
//
// Lifecycle: Open() → WriteFrame()* → Close(). Close() flushes the codec and
// writes the trailer; the destructor closes without reporting.
//
// Error Handling:
// - Every method returns false on failure and logs the av_strerror text
class VideoEncoder : public render::FrameSink {
 public:
  explicit VideoEncoder(VideoEncoderConfig config);
  ~VideoEncoder() override;

  VideoEncoder(const VideoEncoder&) = delete;
  VideoEncoder& operator=(const VideoEncoder&) = delete;

  bool Open();
  bool WriteFrame(const render::RgbFrame& frame) override;
  bool Close();

  bool IsOpen() const { return format_ctx_ != nullptr; }
  int64_t frames_written() const { return frames_written_; }
  const std::string& codec_name() const { return codec_name_; }

 private:
  bool SendAndDrain(AVFrame* frame);
  void Release();

  VideoEncoderConfig config_;
  std::string codec_name_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVStream* video_stream_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  bool header_written_ = false;
  int64_t frames_written_ = 0;
};

}  // namespace clipforge::encode

#endif  // CLIPFORGE_ENCODE_VIDEO_ENCODER_H_
