// Repository: ClipForge-render
// Component: Overlay Compositor
// Purpose: Time-windowed, locally faded "over" blending of pre-baked overlays.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/Compositor.hpp"

#include <algorithm>

namespace clipforge::render {

std::optional<double> OverlayOpacityAt(const PrebakedOverlay& overlay, double t_s) {
  if (t_s < overlay.start_s || t_s >= overlay.end_s) {
    return std::nullopt;
  }
  double opacity = 1.0;
  if (overlay.fade_in_s > 0.0 && t_s < overlay.start_s + overlay.fade_in_s) {
    opacity = (t_s - overlay.start_s) / overlay.fade_in_s;
  } else if (overlay.fade_out_s > 0.0 && t_s > overlay.end_s - overlay.fade_out_s) {
    opacity = (overlay.end_s - t_s) / overlay.fade_out_s;
  }
  return std::clamp(opacity, 0.0, 1.0);
}

void AlphaBlend(RgbFrame& frame, const RgbaBitmap& bitmap, Point position, double opacity) {
  if (frame.Empty() || bitmap.Empty() || opacity <= 0.0) return;
  opacity = std::min(opacity, 1.0);

  const int y0 = std::max(0, position.y);
  const int x0 = std::max(0, position.x);
  const int y1 = std::min(frame.height, position.y + bitmap.height);
  const int x1 = std::min(frame.width, position.x + bitmap.width);
  if (y1 <= y0 || x1 <= x0) return;

  for (int fy = y0; fy < y1; ++fy) {
    const int by = fy - position.y;
    uint8_t* dst = frame.Pixel(x0, fy);
    const uint8_t* src = bitmap.Pixel(x0 - position.x, by);
    for (int fx = x0; fx < x1; ++fx, dst += 3, src += 4) {
      uint8_t a8 = src[3];
      if (opacity < 1.0) {
        a8 = static_cast<uint8_t>(static_cast<float>(a8) * static_cast<float>(opacity));
      }
      if (a8 == 0) continue;
      const float a = static_cast<float>(a8) / 255.0f;
      for (int c = 0; c < 3; ++c) {
        const float v = static_cast<float>(dst[c]) * (1.0f - a) + static_cast<float>(src[c]) * a;
        dst[c] = static_cast<uint8_t>(std::clamp(v, 0.0f, 255.0f));
      }
    }
  }
}

int CompositeOverlays(RgbFrame& frame, const std::vector<PrebakedOverlay>& overlays, double t_s) {
  int drawn = 0;
  for (const auto& overlay : overlays) {
    const std::optional<double> opacity = OverlayOpacityAt(overlay, t_s);
    if (!opacity) continue;
    AlphaBlend(frame, overlay.bitmap, overlay.position, *opacity);
    ++drawn;
  }
  return drawn;
}

}  // namespace clipforge::render
