// Repository: ClipForge-render
// Component: Overlay Baker
// Purpose: Turns request overlays into positioned RGBA bitmaps once per job.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_OVERLAY_BAKER_HPP_
#define CLIPFORGE_RENDER_OVERLAY_BAKER_HPP_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "clipforge/render/Compositor.hpp"
#include "clipforge/render/FontResolver.hpp"
#include "clipforge/render/RenderRequest.hpp"
#include "clipforge/render/TextRasterizer.hpp"

namespace clipforge::render {

struct OverlayBakerConfig {
  std::string default_font_path;  // Used when a resolved font cannot be loaded
  std::string logo_dir;
  std::string signature_dir;
};

// OverlayBaker produces the job's PrebakedOverlay list, in compositing order:
// text overlays, then the signature, then the logo.
//
// A single overlay that cannot be baked (empty text, bad colour, unloadable
// font or image, missing asset) is logged and left out; baking never fails
// the job. Fonts are resolved once per family and loaded once per
// (family, size).
class OverlayBaker {
 public:
  OverlayBaker(FontResolver& fonts, OverlayBakerConfig config);

  std::vector<PrebakedOverlay> Bake(const RenderRequest& request);

  std::optional<PrebakedOverlay> BakeText(const TextOverlaySpec& spec, const std::string& label,
                                          double video_duration_s);
  std::optional<PrebakedOverlay> BakeImage(const ImageOverlaySpec& spec, const std::string& dir,
                                           const std::string& label, double video_duration_s);

 private:
  FontFace* FaceFor(const std::string& family, int size);

  FontResolver& fonts_;
  OverlayBakerConfig config_;
  std::map<std::string, std::string> font_paths_;
  std::map<std::pair<std::string, int>, std::unique_ptr<FontFace>> faces_;
};

// Window start/end: a missing start is 0; a missing (or zero) end is the
// video duration.
void ApplyTiming(const OverlayTiming& timing, double video_duration_s, PrebakedOverlay& overlay);

// Multiplies every alpha value by |opacity| (clipped to [0, 1], truncated).
void ScaleAlpha(RgbaBitmap& bitmap, double opacity);

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_OVERLAY_BAKER_HPP_
