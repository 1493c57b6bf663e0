// Repository: ClipForge-render
// Component: Image Loader
// Purpose: Decodes still images (PNG, JPEG, WebP, ...) to RGBA and thumbnails them.
// Copyright (c) 2025 ClipForge

#include "clipforge/decode/ImageLoader.h"

#include <algorithm>
#include <cmath>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
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

// Owns the handful of FFmpeg objects needed for a one-shot decode.
struct ImageDecodeContext {
  AVFormatContext* format_ctx = nullptr;
  AVCodecContext* codec_ctx = nullptr;
  AVFrame* frame = nullptr;
  AVPacket* packet = nullptr;

  ~ImageDecodeContext() {
    if (frame) av_frame_free(&frame);
    if (packet) av_packet_free(&packet);
    if (codec_ctx) avcodec_free_context(&codec_ctx);
    if (format_ctx) avformat_close_input(&format_ctx);
  }
};

bool ConvertToRgba(const AVFrame* frame, render::RgbaBitmap& out) {
  SwsContext* sws = sws_getContext(frame->width, frame->height,
                                   static_cast<AVPixelFormat>(frame->format),
                                   frame->width, frame->height, AV_PIX_FMT_RGBA,
                                   SWS_BICUBIC, nullptr, nullptr, nullptr);
  if (!sws) {
    util::Logger::Error("[ImageLoader] Failed to create RGBA converter");
    return false;
  }
  out = render::RgbaBitmap(frame->width, frame->height);
  uint8_t* dst[4] = {out.data.data(), nullptr, nullptr, nullptr};
  const int dst_stride[4] = {out.width * 4, 0, 0, 0};
  sws_scale(sws, frame->data, frame->linesize, 0, frame->height, dst, dst_stride);
  sws_freeContext(sws);
  return true;
}

}  // namespace

bool LoadImageRgba(const std::string& path, render::RgbaBitmap& out) {
  ImageDecodeContext ctx;

  int ret = avformat_open_input(&ctx.format_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    util::Logger::Warn("[ImageLoader] Cannot open image " + path + ": " + AvErrorString(ret));
    ctx.format_ctx = nullptr;
    return false;
  }
  ret = avformat_find_stream_info(ctx.format_ctx, nullptr);
  if (ret < 0) {
    util::Logger::Warn("[ImageLoader] No stream info for " + path + ": " + AvErrorString(ret));
    return false;
  }

  int stream_index = -1;
  for (unsigned int i = 0; i < ctx.format_ctx->nb_streams; ++i) {
    if (ctx.format_ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      stream_index = static_cast<int>(i);
      break;
    }
  }
  if (stream_index < 0) {
    util::Logger::Warn("[ImageLoader] No image stream in " + path);
    return false;
  }

  AVCodecParameters* codecpar = ctx.format_ctx->streams[stream_index]->codecpar;
  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    util::Logger::Warn("[ImageLoader] No decoder for " + path);
    return false;
  }
  ctx.codec_ctx = avcodec_alloc_context3(codec);
  if (!ctx.codec_ctx || avcodec_parameters_to_context(ctx.codec_ctx, codecpar) < 0) {
    util::Logger::Error("[ImageLoader] Failed to set up codec context for " + path);
    return false;
  }
  ret = avcodec_open2(ctx.codec_ctx, codec, nullptr);
  if (ret < 0) {
    util::Logger::Error("[ImageLoader] Failed to open codec for " + path + ": " +
                        AvErrorString(ret));
    return false;
  }

  ctx.frame = av_frame_alloc();
  ctx.packet = av_packet_alloc();
  if (!ctx.frame || !ctx.packet) {
    util::Logger::Error("[ImageLoader] Allocation failed");
    return false;
  }

  bool flushed = false;
  while (true) {
    ret = avcodec_receive_frame(ctx.codec_ctx, ctx.frame);
    if (ret == 0) {
      return ConvertToRgba(ctx.frame, out);
    }
    if (ret != AVERROR(EAGAIN) || flushed) {
      util::Logger::Warn("[ImageLoader] Could not decode " + path + ": " + AvErrorString(ret));
      return false;
    }
    ret = av_read_frame(ctx.format_ctx, ctx.packet);
    if (ret < 0) {
      avcodec_send_packet(ctx.codec_ctx, nullptr);
      flushed = true;
      continue;
    }
    if (ctx.packet->stream_index == stream_index) {
      ret = avcodec_send_packet(ctx.codec_ctx, ctx.packet);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        av_packet_unref(ctx.packet);
        util::Logger::Warn("[ImageLoader] Corrupt image data in " + path + ": " +
                           AvErrorString(ret));
        return false;
      }
    }
    av_packet_unref(ctx.packet);
  }
}

void ThumbnailSize(int width, int height, int max_side, int& out_width, int& out_height) {
  out_width = width;
  out_height = height;
  if (width <= 0 || height <= 0 || max_side <= 0) return;
  if (width <= max_side && height <= max_side) return;

  if (width >= height) {
    out_width = max_side;
    out_height = std::max(1, static_cast<int>(std::lround(
                                 static_cast<double>(height) * max_side / width)));
  } else {
    out_height = max_side;
    out_width = std::max(1, static_cast<int>(std::lround(
                                static_cast<double>(width) * max_side / height)));
  }
}

bool ThumbnailRgba(const render::RgbaBitmap& in, int max_side, render::RgbaBitmap& out) {
  int w = 0;
  int h = 0;
  ThumbnailSize(in.width, in.height, max_side, w, h);
  if (w == in.width && h == in.height) {
    out = in;
    return true;
  }

  SwsContext* sws = sws_getContext(in.width, in.height, AV_PIX_FMT_RGBA,
                                   w, h, AV_PIX_FMT_RGBA,
                                   SWS_LANCZOS, nullptr, nullptr, nullptr);
  if (!sws) {
    util::Logger::Error("[ImageLoader] Failed to create thumbnail scaler");
    return false;
  }
  out = render::RgbaBitmap(w, h);
  const uint8_t* src[4] = {in.data.data(), nullptr, nullptr, nullptr};
  const int src_stride[4] = {in.width * 4, 0, 0, 0};
  uint8_t* dst[4] = {out.data.data(), nullptr, nullptr, nullptr};
  const int dst_stride[4] = {w * 4, 0, 0, 0};
  sws_scale(sws, src, src_stride, 0, in.height, dst, dst_stride);
  sws_freeContext(sws);
  return true;
}

}  // namespace clipforge::decode
