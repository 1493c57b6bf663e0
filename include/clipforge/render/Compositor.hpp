// Repository: ClipForge-render
// Component: Overlay Compositor
// Purpose: Time-windowed, locally faded "over" blending of pre-baked overlays.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_COMPOSITOR_HPP_
#define CLIPFORGE_RENDER_COMPOSITOR_HPP_

#include <optional>
#include <string>
#include <vector>

#include "clipforge/render/Image.hpp"
#include "clipforge/render/PositionResolver.hpp"

namespace clipforge::render {

// Job-scoped overlay ready for per-frame compositing. Opacity is already baked
// into the bitmap's alpha channel.
struct PrebakedOverlay {
  std::string label;       // "text_0", "signature", "logo" (logs only)
  RgbaBitmap bitmap;
  Point position;
  double start_s = 0.0;
  double end_s = 0.0;      // Exclusive
  double fade_in_s = 0.0;
  double fade_out_s = 0.0;
};

// Returns nullopt when |t_s| is outside [start_s, end_s). Otherwise the local
// fade multiplier in [0, 1]: ramps up over [start, start + fade_in), down over
// (end - fade_out, end), 1 elsewhere.
std::optional<double> OverlayOpacityAt(const PrebakedOverlay& overlay, double t_s);

// Blends |bitmap| onto |frame| with its top-left corner at |position|, alpha
// scaled by |opacity|. Portions outside the frame are skipped.
void AlphaBlend(RgbFrame& frame, const RgbaBitmap& bitmap, Point position, double opacity = 1.0);

// Composites every overlay active at |t_s| in list order. Returns the number
// of overlays drawn.
int CompositeOverlays(RgbFrame& frame, const std::vector<PrebakedOverlay>& overlays, double t_s);

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_COMPOSITOR_HPP_
