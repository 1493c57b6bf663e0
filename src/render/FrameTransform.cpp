// Repository: ClipForge-render
// Component: Frame Transform Pipeline
// Purpose: Per-frame aspect crop/scale, colour effects, blur and master fade.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/FrameTransform.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>

extern "C" {
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/mem.h>
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

#include "clipforge/util/Logger.hpp"

namespace clipforge::render {

namespace {

constexpr double kTargetAspect = 9.0 / 16.0;
constexpr double kAspectTolerance = 0.01;

inline uint8_t ClipToByte(double v) {
  // Matches a clip-then-truncate float→uint8 conversion.
  if (v <= 0.0) return 0;
  if (v >= 255.0) return 255;
  return static_cast<uint8_t>(v);
}

inline uint8_t RoundToByte(double v) {
  if (v <= 0.0) return 0;
  if (v >= 255.0) return 255;
  return static_cast<uint8_t>(std::lround(v));
}

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

CropRect ComputeCenterCrop(int width, int height) {
  CropRect r{0, 0, width, height};
  if (width <= 0 || height <= 0) return r;

  const double aspect = static_cast<double>(width) / static_cast<double>(height);
  if (std::abs(aspect - kTargetAspect) < kAspectTolerance) return r;

  if (aspect > kTargetAspect) {
    r.width = static_cast<int>(height * kTargetAspect);
    r.x = (width - r.width) / 2;
  } else {
    r.height = static_cast<int>(width / kTargetAspect);
    r.y = (height - r.height) / 2;
  }
  return r;
}

FrameScaler::~FrameScaler() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
}

bool FrameScaler::ResizeAndCrop(const RgbFrame& in, RgbFrame& out) {
  if (in.Empty()) return false;

  const CropRect crop = ComputeCenterCrop(in.width, in.height);
  if (!sws_ctx_ || crop.width != src_width_ || crop.height != src_height_) {
    if (sws_ctx_) {
      sws_freeContext(sws_ctx_);
      sws_ctx_ = nullptr;
    }
    sws_ctx_ = sws_getContext(crop.width, crop.height, AV_PIX_FMT_RGB24,
                              kOutputWidth, kOutputHeight, AV_PIX_FMT_RGB24,
                              SWS_AREA, nullptr, nullptr, nullptr);
    if (!sws_ctx_) {
      util::Logger::Error("[FrameTransform] Failed to create scaler " +
                          std::to_string(crop.width) + "x" + std::to_string(crop.height) +
                          " -> " + std::to_string(kOutputWidth) + "x" +
                          std::to_string(kOutputHeight));
      return false;
    }
    src_width_ = crop.width;
    src_height_ = crop.height;
  }

  if (out.width != kOutputWidth || out.height != kOutputHeight || out.data.empty()) {
    out = RgbFrame(kOutputWidth, kOutputHeight);
  }

  const uint8_t* src[4] = {in.Pixel(crop.x, crop.y), nullptr, nullptr, nullptr};
  const int src_stride[4] = {static_cast<int>(in.Stride()), 0, 0, 0};
  uint8_t* dst[4] = {out.data.data(), nullptr, nullptr, nullptr};
  const int dst_stride[4] = {static_cast<int>(out.Stride()), 0, 0, 0};
  sws_scale(sws_ctx_, src, src_stride, 0, crop.height, dst, dst_stride);
  return true;
}

ColorEffects ColorEffects::FromVideoSettings(const VideoSettings& video) {
  ColorEffects e;
  e.exposure = video.exposure;
  e.brightness = video.brightness;
  e.contrast = video.contrast;
  e.saturation = video.saturation;
  return e;
}

bool ColorEffects::IsIdentity() const {
  return exposure == 1.0 && brightness == 1.0 && contrast == 1.0 && saturation == 1.0;
}

void ApplyColorEffects(RgbFrame& frame, const ColorEffects& effects) {
  if (effects.IsIdentity() || frame.Empty()) return;

  const size_t pixels = static_cast<size_t>(frame.width) * frame.height;
  uint8_t* p = frame.data.data();
  for (size_t i = 0; i < pixels; ++i, p += 3) {
    const int mx = std::max({p[0], p[1], p[2]});
    const int mn = std::min({p[0], p[1], p[2]});

    double v = mx;
    double s = (mx == 0) ? 0.0 : std::round(255.0 * (mx - mn) / mx);

    if (effects.exposure != 1.0) v *= effects.exposure;
    if (effects.brightness != 1.0) v += (effects.brightness - 1.0) * 127.5;
    if (effects.contrast != 1.0) v = (v - 127.5) * effects.contrast + 127.5;
    if (effects.saturation != 1.0) s *= effects.saturation;

    const double v8 = ClipToByte(v);
    const double s8 = ClipToByte(s);

    if (mx == mn) {
      p[0] = p[1] = p[2] = static_cast<uint8_t>(v8);
      continue;
    }
    // Each channel sits at a hue-determined fraction between max and min;
    // rebuild it against the new value and saturation.
    const double chroma = v8 * (s8 / 255.0);
    for (int c = 0; c < 3; ++c) {
      const double f = static_cast<double>(mx - p[c]) / static_cast<double>(mx - mn);
      p[c] = RoundToByte(v8 - chroma * f);
    }
  }
}

int BlurKernelSize(double blur) {
  const int b = static_cast<int>(blur);
  if (b <= 0) return 0;
  return (b % 2 != 0) ? b * 2 + 1 : b + 1;
}

double GaussianSigmaForKernel(int kernel_size) {
  return 0.3 * ((kernel_size - 1) * 0.5 - 1.0) + 0.8;
}

GaussianBlur::GaussianBlur(int kernel_size)
    : kernel_size_(kernel_size),
      sigma_(kernel_size > 1 ? GaussianSigmaForKernel(kernel_size) : 0.0) {}

GaussianBlur::~GaussianBlur() { Release(); }

void GaussianBlur::Release() {
  if (graph_) avfilter_graph_free(&graph_);
  if (in_frame_) av_frame_free(&in_frame_);
  if (out_frame_) av_frame_free(&out_frame_);
  src_ctx_ = nullptr;
  sink_ctx_ = nullptr;
  width_ = 0;
  height_ = 0;
  next_pts_ = 0;
}

bool GaussianBlur::Configure(int width, int height) {
  graph_ = avfilter_graph_alloc();
  in_frame_ = av_frame_alloc();
  out_frame_ = av_frame_alloc();
  if (!graph_ || !in_frame_ || !out_frame_) {
    util::Logger::Error("[FrameTransform] Failed to allocate blur filter graph");
    return false;
  }

  char args[160];
  std::snprintf(args, sizeof(args), "video_size=%dx%d:pix_fmt=%d:time_base=1/30:pixel_aspect=1/1",
                width, height, static_cast<int>(AV_PIX_FMT_RGB24));
  int ret = avfilter_graph_create_filter(&src_ctx_, avfilter_get_by_name("buffer"), "in", args,
                                         nullptr, graph_);
  if (ret < 0) {
    util::Logger::Error("[FrameTransform] Cannot create blur source: " + AvErrorString(ret));
    return false;
  }
  ret = avfilter_graph_create_filter(&sink_ctx_, avfilter_get_by_name("buffersink"), "out",
                                     nullptr, nullptr, graph_);
  if (ret < 0) {
    util::Logger::Error("[FrameTransform] Cannot create blur sink: " + AvErrorString(ret));
    return false;
  }

  // gblur works on planar formats; the trailing format filter brings the
  // result back to packed RGB24.
  char description[96];
  std::snprintf(description, sizeof(description), "gblur=sigma=%.4f,format=rgb24", sigma_);

  AVFilterInOut* outputs = avfilter_inout_alloc();
  AVFilterInOut* inputs = avfilter_inout_alloc();
  if (!outputs || !inputs) {
    avfilter_inout_free(&outputs);
    avfilter_inout_free(&inputs);
    util::Logger::Error("[FrameTransform] Failed to allocate blur graph endpoints");
    return false;
  }
  outputs->name = av_strdup("in");
  outputs->filter_ctx = src_ctx_;
  outputs->pad_idx = 0;
  outputs->next = nullptr;
  inputs->name = av_strdup("out");
  inputs->filter_ctx = sink_ctx_;
  inputs->pad_idx = 0;
  inputs->next = nullptr;

  ret = avfilter_graph_parse_ptr(graph_, description, &inputs, &outputs, nullptr);
  avfilter_inout_free(&inputs);
  avfilter_inout_free(&outputs);
  if (ret < 0) {
    util::Logger::Error(std::string("[FrameTransform] Cannot parse blur graph '") + description +
                        "': " + AvErrorString(ret));
    return false;
  }
  ret = avfilter_graph_config(graph_, nullptr);
  if (ret < 0) {
    util::Logger::Error("[FrameTransform] Cannot configure blur graph: " + AvErrorString(ret));
    return false;
  }

  width_ = width;
  height_ = height;
  util::Logger::Debug("[FrameTransform] Blur graph " + std::to_string(width) + "x" +
                      std::to_string(height) + " " + description);
  return true;
}

bool GaussianBlur::Apply(RgbFrame& frame) {
  if (!enabled() || frame.Empty()) return true;

  if (!graph_ || frame.width != width_ || frame.height != height_) {
    Release();
    if (!Configure(frame.width, frame.height)) {
      Release();
      return false;
    }
  }

  in_frame_->format = AV_PIX_FMT_RGB24;
  in_frame_->width = frame.width;
  in_frame_->height = frame.height;
  int ret = av_frame_get_buffer(in_frame_, 0);
  if (ret < 0) {
    util::Logger::Error("[FrameTransform] Cannot allocate blur input: " + AvErrorString(ret));
    return false;
  }
  for (int y = 0; y < frame.height; ++y) {
    std::memcpy(in_frame_->data[0] + static_cast<size_t>(y) * in_frame_->linesize[0],
                frame.Pixel(0, y), frame.Stride());
  }
  in_frame_->pts = next_pts_++;

  ret = av_buffersrc_add_frame(src_ctx_, in_frame_);
  if (ret < 0) {
    av_frame_unref(in_frame_);
    util::Logger::Error("[FrameTransform] Blur push failed: " + AvErrorString(ret));
    return false;
  }
  ret = av_buffersink_get_frame(sink_ctx_, out_frame_);
  if (ret < 0) {
    util::Logger::Error("[FrameTransform] Blur pull failed: " + AvErrorString(ret));
    return false;
  }

  for (int y = 0; y < frame.height; ++y) {
    std::memcpy(frame.Pixel(0, y),
                out_frame_->data[0] + static_cast<size_t>(y) * out_frame_->linesize[0],
                frame.Stride());
  }
  av_frame_unref(out_frame_);
  return true;
}

double MasterFadeAlpha(double t_s, double duration_s, double fade_in_s, double fade_out_s) {
  double alpha = 1.0;
  if (fade_in_s > 0.0 && t_s < fade_in_s) {
    alpha = t_s / fade_in_s;
  }
  const double fade_out_start = duration_s - fade_out_s;
  if (fade_out_s > 0.0 && t_s > fade_out_start) {
    alpha = std::max(0.0, 1.0 - ((t_s - fade_out_start) / fade_out_s));
  }
  return std::clamp(alpha, 0.0, 1.0);
}

void ApplyMasterFade(RgbFrame& frame, double alpha) {
  if (alpha >= 1.0) return;
  alpha = std::max(0.0, alpha);
  for (uint8_t& b : frame.data) {
    b = RoundToByte(b * alpha);
  }
}

}  // namespace clipforge::render
