// Repository: ClipForge-render
// Component: FFmpeg Decoder
// Purpose: Sequential video decoding to packed RGB24 using libavformat/libavcodec.
// Copyright (c) 2025 ClipForge

#include "clipforge/decode/FFmpegDecoder.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libswscale/swscale.h>
}

#include "clipforge/util/Logger.hpp"

namespace clipforge::decode {

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

FFmpegDecoder::FFmpegDecoder(const DecoderConfig& config)
    : config_(config),
      format_ctx_(nullptr),
      codec_ctx_(nullptr),
      frame_(nullptr),
      packet_(nullptr),
      sws_ctx_(nullptr),
      video_stream_index_(-1),
      demux_eof_(false),
      eof_reached_(false),
      sws_src_width_(0),
      sws_src_height_(0),
      sws_src_format_(-1) {}

FFmpegDecoder::~FFmpegDecoder() {
  Close();
}

bool FFmpegDecoder::Open() {
  util::Logger::Debug("[FFmpegDecoder] Opening: " + config_.input_uri);

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    util::Logger::Error("[FFmpegDecoder] open_input FAILED uri=" + config_.input_uri +
                        " ret=" + std::to_string(ret) + " err=" + AvErrorString(ret));
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    util::Logger::Error("[FFmpegDecoder] avformat_find_stream_info FAILED uri=" +
                        config_.input_uri + " err=" + AvErrorString(ret));
    Close();
    return false;
  }

  if (!FindVideoStream()) {
    util::Logger::Error("[FFmpegDecoder] find_video_stream FAILED uri=" + config_.input_uri +
                        " (no video stream)");
    Close();
    return false;
  }

  if (!InitializeCodec()) {
    util::Logger::Error("[FFmpegDecoder] initialize_codec FAILED uri=" + config_.input_uri);
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    util::Logger::Error("[FFmpegDecoder] packet_alloc FAILED uri=" + config_.input_uri);
    Close();
    return false;
  }

  const util::RationalFps fps = GetVideoRationalFps();
  util::Logger::Debug("[FFmpegDecoder] open_input OK uri=" + config_.input_uri + " " +
                      std::to_string(GetVideoWidth()) + "x" + std::to_string(GetVideoHeight()) +
                      " @ " + std::to_string(fps.num) + "/" + std::to_string(fps.den) + " fps");
  return true;
}

bool FFmpegDecoder::ReadFrame(render::RgbFrame& out) {
  if (!IsOpen() || eof_reached_) {
    return false;
  }
  if (!ReadAndDecodeFrame(out)) {
    return false;
  }
  stats_.frames_decoded++;
  return true;
}

void FFmpegDecoder::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  video_stream_index_ = -1;
  sws_src_width_ = 0;
  sws_src_height_ = 0;
  sws_src_format_ = -1;
}

int FFmpegDecoder::GetVideoWidth() const {
  if (!codec_ctx_) return 0;
  return codec_ctx_->width;
}

int FFmpegDecoder::GetVideoHeight() const {
  if (!codec_ctx_) return 0;
  return codec_ctx_->height;
}

util::RationalFps FFmpegDecoder::GetVideoRationalFps() const {
  if (!format_ctx_ || video_stream_index_ < 0) return util::RationalFps{0, 1};

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVRational fps = stream->avg_frame_rate;
  if (fps.num <= 0 || fps.den <= 0) {
    fps = stream->r_frame_rate;
  }
  if (fps.num <= 0 || fps.den <= 0) return util::RationalFps{0, 1};
  return util::RationalFps(static_cast<int64_t>(fps.num), static_cast<int64_t>(fps.den));
}

double FFmpegDecoder::GetVideoDuration() const {
  if (!format_ctx_) return 0.0;

  if (format_ctx_->duration != AV_NOPTS_VALUE) {
    return static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
  }

  return 0.0;
}

bool FFmpegDecoder::FindVideoStream() {
  for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
    if (format_ctx_->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      video_stream_index_ = static_cast<int>(i);
      return true;
    }
  }

  return false;
}

bool FFmpegDecoder::InitializeCodec() {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    util::Logger::Error("[FFmpegDecoder] Codec not found: " +
                        std::to_string(static_cast<int>(codecpar->codec_id)));
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    util::Logger::Error("[FFmpegDecoder] Failed to allocate codec context");
    return false;
  }

  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    util::Logger::Error("[FFmpegDecoder] Failed to copy codec parameters");
    return false;
  }

  if (config_.max_decode_threads > 0) {
    codec_ctx_->thread_count = config_.max_decode_threads;
  }
  codec_ctx_->thread_type = FF_THREAD_FRAME;

  const int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    util::Logger::Error("[FFmpegDecoder] Failed to open codec: " + AvErrorString(ret));
    return false;
  }

  frame_ = av_frame_alloc();
  if (!frame_) {
    util::Logger::Error("[FFmpegDecoder] Failed to allocate frame");
    return false;
  }

  return true;
}

bool FFmpegDecoder::EnsureScaler(int width, int height, int pix_fmt) {
  if (sws_ctx_ && width == sws_src_width_ && height == sws_src_height_ &&
      pix_fmt == sws_src_format_) {
    return true;
  }
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }

  // Native size, pixel format conversion only.
  sws_ctx_ = sws_getContext(width, height, static_cast<AVPixelFormat>(pix_fmt),
                            width, height, AV_PIX_FMT_RGB24,
                            SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    util::Logger::Error("[FFmpegDecoder] Failed to create scaler context");
    return false;
  }
  sws_src_width_ = width;
  sws_src_height_ = height;
  sws_src_format_ = pix_fmt;
  return true;
}

bool FFmpegDecoder::ReadAndDecodeFrame(render::RgbFrame& out) {
  while (true) {
    // Pending decoded frames first.
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) {
      const bool ok = ConvertFrame(frame_, out);
      av_frame_unref(frame_);
      if (!ok) stats_.decode_errors++;
      return ok;
    }
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      stats_.decode_errors++;
      return false;
    }
    if (demux_eof_) {
      // Drain requested but codec still wants input; nothing left to give.
      eof_reached_ = true;
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      demux_eof_ = true;
      // Enter draining mode so delayed frames are returned.
      avcodec_send_packet(codec_ctx_, nullptr);
      continue;
    }
    if (ret < 0) {
      stats_.decode_errors++;
      util::Logger::Warn("[FFmpegDecoder] av_read_frame failed: " + AvErrorString(ret));
      demux_eof_ = true;
      avcodec_send_packet(codec_ctx_, nullptr);
      return false;
    }

    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      stats_.decode_errors++;
      return false;
    }
  }
}

bool FFmpegDecoder::ConvertFrame(AVFrame* av_frame, render::RgbFrame& out) {
  if (!EnsureScaler(av_frame->width, av_frame->height, av_frame->format)) {
    return false;
  }

  if (out.width != av_frame->width || out.height != av_frame->height || out.data.empty()) {
    out = render::RgbFrame(av_frame->width, av_frame->height);
  }

  uint8_t* dst[4] = {out.data.data(), nullptr, nullptr, nullptr};
  const int dst_stride[4] = {static_cast<int>(out.Stride()), 0, 0, 0};
  sws_scale(sws_ctx_, av_frame->data, av_frame->linesize, 0, av_frame->height, dst, dst_stride);
  return true;
}

}  // namespace clipforge::decode
