// Repository: ClipForge-render
// Component: Video Encoder
// Purpose: Encodes finished RGB24 frames into a silent MP4 file.
// Copyright (c) 2025 ClipForge

#include "clipforge/encode/VideoEncoder.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

#include "clipforge/util/Logger.hpp"

namespace clipforge::encode {

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return errbuf;
}

}  // namespace

VideoEncoder::VideoEncoder(VideoEncoderConfig config) : config_(std::move(config)) {}

VideoEncoder::~VideoEncoder() {
  if (IsOpen()) {
    Close();
  }
}

bool VideoEncoder::Open() {
  if (!config_.fps.IsValid()) {
    util::Logger::Error("[VideoEncoder] Invalid frame rate");
    return false;
  }

  av_log_set_level(AV_LOG_ERROR);

  const AVCodec* codec = avcodec_find_encoder_by_name("libx264");
  if (!codec) {
    util::Logger::Warn("[VideoEncoder] libx264 not found, falling back to mpeg4");
    codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
  }
  if (!codec) {
    util::Logger::Error("[VideoEncoder] No usable video encoder");
    return false;
  }
  codec_name_ = codec->name;

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "mp4",
                                           config_.output_path.c_str());
  if (ret < 0 || !format_ctx_) {
    util::Logger::Error("[VideoEncoder] Failed to allocate output context: " +
                        AvErrorString(ret));
    format_ctx_ = nullptr;
    return false;
  }

  video_stream_ = avformat_new_stream(format_ctx_, codec);
  if (!video_stream_) {
    util::Logger::Error("[VideoEncoder] Failed to create video stream");
    Release();
    return false;
  }
  video_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    util::Logger::Error("[VideoEncoder] Failed to allocate codec context");
    Release();
    return false;
  }

  const int fps_num = static_cast<int>(config_.fps.num);
  const int fps_den = static_cast<int>(config_.fps.den);
  codec_ctx_->width = config_.width;
  codec_ctx_->height = config_.height;
  codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  codec_ctx_->time_base = AVRational{fps_den, fps_num};
  codec_ctx_->framerate = AVRational{fps_num, fps_den};
  codec_ctx_->gop_size = config_.gop_size;
  video_stream_->time_base = codec_ctx_->time_base;
  video_stream_->avg_frame_rate = codec_ctx_->framerate;
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  AVDictionary* opts = nullptr;
  if (codec_name_ == "libx264") {
    av_dict_set(&opts, "preset", "veryfast", 0);
    av_dict_set(&opts, "crf", std::to_string(config_.crf).c_str(), 0);
  } else {
    codec_ctx_->bit_rate = config_.fallback_bitrate;
  }
  ret = avcodec_open2(codec_ctx_, codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    util::Logger::Error("[VideoEncoder] Failed to open codec " + codec_name_ + ": " +
                        AvErrorString(ret));
    Release();
    return false;
  }

  // Re-copy codec parameters AFTER avcodec_open2 to capture extradata.
  ret = avcodec_parameters_from_context(video_stream_->codecpar, codec_ctx_);
  if (ret < 0) {
    util::Logger::Error("[VideoEncoder] Failed to copy codec parameters: " + AvErrorString(ret));
    Release();
    return false;
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    util::Logger::Error("[VideoEncoder] Failed to allocate frame or packet");
    Release();
    return false;
  }
  frame_->format = AV_PIX_FMT_YUV420P;
  frame_->width = config_.width;
  frame_->height = config_.height;
  ret = av_frame_get_buffer(frame_, 32);
  if (ret < 0) {
    util::Logger::Error("[VideoEncoder] Failed to allocate frame buffer: " + AvErrorString(ret));
    Release();
    return false;
  }

  sws_ctx_ = sws_getContext(config_.width, config_.height, AV_PIX_FMT_RGB24,
                            config_.width, config_.height, AV_PIX_FMT_YUV420P,
                            SWS_BICUBIC, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    util::Logger::Error("[VideoEncoder] Failed to create colour converter");
    Release();
    return false;
  }

  if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&format_ctx_->pb, config_.output_path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      util::Logger::Error("[VideoEncoder] Failed to open output " + config_.output_path + ": " +
                          AvErrorString(ret));
      Release();
      return false;
    }
  }

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) {
    util::Logger::Error("[VideoEncoder] Failed to write header: " + AvErrorString(ret));
    Release();
    return false;
  }
  header_written_ = true;

  util::Logger::Debug("[VideoEncoder] Opened " + config_.output_path + " codec=" + codec_name_ +
                      " " + std::to_string(config_.width) + "x" +
                      std::to_string(config_.height) + " @ " + std::to_string(fps_num) + "/" +
                      std::to_string(fps_den));
  return true;
}

bool VideoEncoder::WriteFrame(const render::RgbFrame& frame) {
  if (!IsOpen() || !header_written_) return false;
  if (frame.width != config_.width || frame.height != config_.height) {
    util::Logger::Error("[VideoEncoder] Frame size " + std::to_string(frame.width) + "x" +
                        std::to_string(frame.height) + " does not match encoder");
    return false;
  }

  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    util::Logger::Error("[VideoEncoder] Frame not writable: " + AvErrorString(ret));
    return false;
  }

  const uint8_t* src[4] = {frame.data.data(), nullptr, nullptr, nullptr};
  const int src_stride[4] = {static_cast<int>(frame.Stride()), 0, 0, 0};
  sws_scale(sws_ctx_, src, src_stride, 0, frame.height, frame_->data, frame_->linesize);
  frame_->pts = frames_written_;

  if (!SendAndDrain(frame_)) return false;
  frames_written_++;
  return true;
}

bool VideoEncoder::SendAndDrain(AVFrame* frame) {
  int ret = avcodec_send_frame(codec_ctx_, frame);
  if (ret < 0 && ret != AVERROR_EOF) {
    util::Logger::Error("[VideoEncoder] avcodec_send_frame failed: " + AvErrorString(ret));
    return false;
  }

  while (true) {
    ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
    if (ret < 0) {
      util::Logger::Error("[VideoEncoder] avcodec_receive_packet failed: " + AvErrorString(ret));
      return false;
    }
    packet_->stream_index = video_stream_->index;
    av_packet_rescale_ts(packet_, codec_ctx_->time_base, video_stream_->time_base);
    // av_interleaved_write_frame takes ownership and unrefs the packet.
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    if (ret < 0) {
      util::Logger::Error("[VideoEncoder] Error writing packet: " + AvErrorString(ret));
      return false;
    }
  }
  return true;
}

bool VideoEncoder::Close() {
  if (!IsOpen()) return true;

  bool ok = true;
  if (header_written_) {
    ok = SendAndDrain(nullptr);
    const int ret = av_write_trailer(format_ctx_);
    if (ret < 0) {
      util::Logger::Error("[VideoEncoder] Error writing trailer: " + AvErrorString(ret));
      ok = false;
    }
  }
  Release();
  return ok;
}

void VideoEncoder::Release() {
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
    if (format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
      avio_closep(&format_ctx_->pb);
    }
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  video_stream_ = nullptr;
  header_written_ = false;
}

}  // namespace clipforge::encode
