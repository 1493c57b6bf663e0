// Repository: ClipForge-render
// Component: Frame Transform Pipeline
// Purpose: Per-frame aspect crop/scale, colour effects, blur and master fade.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_FRAME_TRANSFORM_HPP_
#define CLIPFORGE_RENDER_FRAME_TRANSFORM_HPP_

#include <cstdint>

#include "clipforge/render/Image.hpp"
#include "clipforge/render/RenderRequest.hpp"

struct AVFilterContext;
struct AVFilterGraph;
struct AVFrame;
struct SwsContext;

namespace clipforge::render {

struct CropRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool operator==(const CropRect& o) const {
    return x == o.x && y == o.y && width == o.width && height == o.height;
  }
};

// Centre crop of a |width|x|height| source to the 9:16 output aspect. Sources
// within 0.01 of the target aspect are used whole. The longer axis is cropped.
CropRect ComputeCenterCrop(int width, int height);

// FrameScaler crops to 9:16 and area-scales to kOutputWidth x kOutputHeight
// using libswscale. The scaler context is cached across frames of the same
// source geometry.
//
// Thread Safety: not thread-safe; one per render.
class FrameScaler {
 public:
  FrameScaler() = default;
  ~FrameScaler();

  FrameScaler(const FrameScaler&) = delete;
  FrameScaler& operator=(const FrameScaler&) = delete;

  // Returns false if the scaler cannot be created for |in|.
  bool ResizeAndCrop(const RgbFrame& in, RgbFrame& out);

 private:
  SwsContext* sws_ctx_ = nullptr;
  int src_width_ = 0;
  int src_height_ = 0;
};

struct ColorEffects {
  double exposure = 1.0;
  double brightness = 1.0;
  double contrast = 1.0;
  double saturation = 1.0;

  static ColorEffects FromVideoSettings(const VideoSettings& video);
  bool IsIdentity() const;
};

// Applied in HSV space in this exact order:
//   V *= exposure
//   V += (brightness - 1) * 127.5
//   V  = (V - 127.5) * contrast + 127.5
//   S *= saturation
// then V and S are clipped to [0, 255]. Hue is preserved.
void ApplyColorEffects(RgbFrame& frame, const ColorEffects& effects);

// Gaussian kernel size for a blur amount (always odd; 0 means no blur).
int BlurKernelSize(double blur);

// Gaussian sigma for an odd |kernel_size|: 0.3 * ((k - 1) * 0.5 - 1) + 0.8.
double GaussianSigmaForKernel(int kernel_size);

// GaussianBlur runs frames through a libavfilter `buffer -> gblur ->
// buffersink` graph. The graph is built on the first frame and rebuilt only if
// the frame geometry changes. A kernel size of 0 or 1 disables the blur.
//
// Thread Safety: not thread-safe; one per render.
class GaussianBlur {
 public:
  explicit GaussianBlur(int kernel_size);
  ~GaussianBlur();

  GaussianBlur(const GaussianBlur&) = delete;
  GaussianBlur& operator=(const GaussianBlur&) = delete;

  bool enabled() const { return kernel_size_ > 1; }
  double sigma() const { return sigma_; }

  // Blurs |frame| in place. Returns false if the filter graph fails.
  bool Apply(RgbFrame& frame);

 private:
  bool Configure(int width, int height);
  void Release();

  int kernel_size_;
  double sigma_;
  AVFilterGraph* graph_ = nullptr;
  AVFilterContext* src_ctx_ = nullptr;
  AVFilterContext* sink_ctx_ = nullptr;
  AVFrame* in_frame_ = nullptr;
  AVFrame* out_frame_ = nullptr;
  int width_ = 0;
  int height_ = 0;
  int64_t next_pts_ = 0;
};

// Linear fade from black over |fade_in_s| and back to black over the last
// |fade_out_s| of |duration_s|. Returns a multiplier in [0, 1].
double MasterFadeAlpha(double t_s, double duration_s, double fade_in_s, double fade_out_s);

// Scales every channel by |alpha| (no-op for alpha >= 1).
void ApplyMasterFade(RgbFrame& frame, double alpha);

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_FRAME_TRANSFORM_HPP_
