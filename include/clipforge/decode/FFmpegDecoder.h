// Repository: ClipForge-render
// Component: FFmpeg Decoder
// Purpose: Sequential video decoding to packed RGB24 using libavformat/libavcodec.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_DECODE_FFMPEG_DECODER_H_
#define CLIPFORGE_DECODE_FFMPEG_DECODER_H_

#include <cstdint>
#include <string>

#include "clipforge/render/FrameIO.hpp"
#include "clipforge/util/RationalFps.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace clipforge::decode {

// DecoderConfig holds configuration for FFmpeg-based decoding.
struct DecoderConfig {
  std::string input_uri;        // File path to decode
  int max_decode_threads;       // Maximum decoder threads (0 = auto)

  DecoderConfig() : max_decode_threads(0) {}
};

// DecoderStats tracks decoding progress and errors.
struct DecoderStats {
  uint64_t frames_decoded;
  uint64_t decode_errors;

  DecoderStats() : frames_decoded(0), decode_errors(0) {}
};

// FFmpegDecoder decodes the first video stream of a file into RGB24 frames
// at the stream's native resolution. Audio and other streams are skipped.
//
// Thread Safety:
// - Not thread-safe: Use from the render worker's single thread
//
// Lifecycle:
// 1. Construct with config
// 2. Call Open() to initialize decoder
// 3. Call ReadFrame() repeatedly
// 4. Call Close() or rely on destructor
//
// Error Handling:
// - Returns false on errors with stats updated
// - A corrupt packet fails one ReadFrame() call; the next call continues
// - At end of input the codec is drained before ReadFrame() reports EOF
class FFmpegDecoder : public render::FrameSource {
 public:
  explicit FFmpegDecoder(const DecoderConfig& config);
  ~FFmpegDecoder() override;

  // Disable copy and move
  FFmpegDecoder(const FFmpegDecoder&) = delete;
  FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

  // Opens the input file and initializes decoder.
  // Returns true on success, false on error.
  bool Open();

  // Decodes the next frame into |out| (RGB24, native size).
  bool ReadFrame(render::RgbFrame& out) override;

  // Closes the decoder and releases resources.
  void Close();

  bool IsOpen() const { return format_ctx_ != nullptr; }

  // True once the demuxer and the codec are both exhausted.
  bool IsEOF() const { return eof_reached_; }

  const DecoderStats& GetStats() const { return stats_; }

  int GetVideoWidth() const;
  int GetVideoHeight() const;
  // avg_frame_rate, falling back to r_frame_rate when unset.
  util::RationalFps GetVideoRationalFps() const;
  double GetVideoDuration() const;

 private:
  bool FindVideoStream();
  bool InitializeCodec();
  bool EnsureScaler(int width, int height, int pix_fmt);
  bool ReadAndDecodeFrame(render::RgbFrame& out);
  bool ConvertFrame(AVFrame* av_frame, render::RgbFrame& out);

  DecoderConfig config_;
  DecoderStats stats_;

  AVFormatContext* format_ctx_;
  AVCodecContext* codec_ctx_;
  AVFrame* frame_;
  AVPacket* packet_;
  SwsContext* sws_ctx_;

  int video_stream_index_;
  bool demux_eof_;
  bool eof_reached_;

  int sws_src_width_;
  int sws_src_height_;
  int sws_src_format_;
};

}  // namespace clipforge::decode

#endif  // CLIPFORGE_DECODE_FFMPEG_DECODER_H_
