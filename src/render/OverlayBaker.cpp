// Repository: ClipForge-render
// Component: Overlay Baker
// Purpose: Turns request overlays into positioned RGBA bitmaps once per job.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/OverlayBaker.hpp"

#include <algorithm>
#include <filesystem>

#include "clipforge/decode/ImageLoader.h"
#include "clipforge/render/PositionResolver.hpp"
#include "clipforge/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipforge::render {

namespace {

constexpr double kLineSpacingFactor = 0.2;

const Size kFrameSize{kOutputWidth, kOutputHeight};

}  // namespace

void ApplyTiming(const OverlayTiming& timing, double video_duration_s, PrebakedOverlay& overlay) {
  overlay.start_s = timing.start_time_s.value_or(0.0);
  overlay.end_s = (timing.end_time_s && *timing.end_time_s != 0.0) ? *timing.end_time_s
                                                                     : video_duration_s;
  overlay.fade_in_s = timing.fade_in_s;
  overlay.fade_out_s = timing.fade_out_s;
}

void ScaleAlpha(RgbaBitmap& bitmap, double opacity) {
  const float factor = static_cast<float>(std::clamp(opacity, 0.0, 1.0));
  if (factor >= 1.0f) return;
  for (size_t i = 3; i < bitmap.data.size(); i += 4) {
    bitmap.data[i] = static_cast<uint8_t>(static_cast<float>(bitmap.data[i]) * factor);
  }
}

OverlayBaker::OverlayBaker(FontResolver& fonts, OverlayBakerConfig config)
    : fonts_(fonts), config_(std::move(config)) {}

std::vector<PrebakedOverlay> OverlayBaker::Bake(const RenderRequest& request) {
  std::vector<PrebakedOverlay> overlays;
  const double duration = request.video.duration_s;

  for (size_t i = 0; i < request.text_overlays.size(); ++i) {
    if (auto baked = BakeText(request.text_overlays[i], "text_" + std::to_string(i), duration)) {
      overlays.push_back(std::move(*baked));
    }
  }

  if (request.signature) {
    std::optional<PrebakedOverlay> baked;
    if (const auto* text = std::get_if<TextOverlaySpec>(&*request.signature)) {
      baked = BakeText(*text, "signature", duration);
    } else {
      baked = BakeImage(std::get<ImageOverlaySpec>(*request.signature), config_.signature_dir,
                        "signature", duration);
    }
    if (baked) overlays.push_back(std::move(*baked));
  }

  if (request.logo) {
    if (auto baked = BakeImage(*request.logo, config_.logo_dir, "logo", duration)) {
      overlays.push_back(std::move(*baked));
    }
  }
  return overlays;
}

FontFace* OverlayBaker::FaceFor(const std::string& family, int size) {
  const auto key = std::make_pair(family, size);
  const auto cached = faces_.find(key);
  if (cached != faces_.end()) return cached->second.get();

  auto path = font_paths_.find(family);
  if (path == font_paths_.end()) {
    path = font_paths_.emplace(family, fonts_.Resolve(family)).first;
  }

  std::unique_ptr<FontFace> face = FontFace::Load(path->second, size);
  if (!face && path->second != config_.default_font_path) {
    util::Logger::Warn("[OverlayBaker] Font '" + family + "' unusable at " + path->second +
                       ", using default font");
    face = FontFace::Load(config_.default_font_path, size);
  }
  if (!face) {
    // Remember the failure so the same overlay style is not retried.
    faces_.emplace(key, nullptr);
    return nullptr;
  }
  FontFace* raw = face.get();
  faces_.emplace(key, std::move(face));
  return raw;
}

std::optional<PrebakedOverlay> OverlayBaker::BakeText(const TextOverlaySpec& spec,
                                                      const std::string& label,
                                                      double video_duration_s) {
  const std::optional<Rgb> color = ParseColor(spec.font_color);
  if (!color) {
    util::Logger::Warn("[OverlayBaker] Could not pre-bake " + label + ": unknown colour '" +
                       spec.font_color + "'");
    return std::nullopt;
  }

  FontFace* face = FaceFor(spec.font, spec.font_size);
  if (!face) {
    util::Logger::Warn("[OverlayBaker] Could not pre-bake " + label + ": no usable font for '" +
                       spec.font + "'");
    return std::nullopt;
  }

  int max_width = 0;
  if (const auto* pixel = std::get_if<PixelPosition>(&spec.position)) {
    max_width = pixel->box_width;
  } else {
    max_width = kOutputWidth - spec.margins.right - spec.margins.left;
  }

  const std::vector<std::string> lines =
      WrapText(spec.text, max_width, [face](const std::string& s) { return face->MeasureWidth(s); });
  if (lines.empty()) {
    util::Logger::Debug("[OverlayBaker] " + label + " has no text, skipped");
    return std::nullopt;
  }

  TextBlockStyle style;
  style.color = *color;
  style.opacity = spec.opacity;
  style.align = spec.align;
  style.line_spacing = spec.font_size * kLineSpacingFactor;

  PrebakedOverlay overlay;
  overlay.label = label;
  overlay.bitmap = RenderTextBlock(*face, lines, style);
  if (overlay.bitmap.Empty()) {
    util::Logger::Debug("[OverlayBaker] " + label + " rendered no visible pixels, skipped");
    return std::nullopt;
  }

  overlay.position =
      ResolvePosition(kFrameSize, Size{overlay.bitmap.width, overlay.bitmap.height}, spec.position,
                      spec.margins, spec.align);
  ApplyTiming(spec.timing, video_duration_s, overlay);

  util::Logger::Debug("[OverlayBaker] " + label + " " + std::to_string(overlay.bitmap.width) +
                      "x" + std::to_string(overlay.bitmap.height) + " at y=" +
                      std::to_string(overlay.position.y) + " x=" +
                      std::to_string(overlay.position.x) + " lines=" +
                      std::to_string(lines.size()));
  return overlay;
}

std::optional<PrebakedOverlay> OverlayBaker::BakeImage(const ImageOverlaySpec& spec,
                                                       const std::string& dir,
                                                       const std::string& label,
                                                       double video_duration_s) {
  if (spec.name.empty()) return std::nullopt;

  const fs::path path = fs::path(dir) / spec.name;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    util::Logger::Warn("[OverlayBaker] " + label + " file not found: " + path.string());
    return std::nullopt;
  }

  RgbaBitmap source;
  if (!decode::LoadImageRgba(path.string(), source)) {
    util::Logger::Warn("[OverlayBaker] Could not pre-bake " + label + " from " + path.string());
    return std::nullopt;
  }

  PrebakedOverlay overlay;
  overlay.label = label;
  if (!decode::ThumbnailRgba(source, spec.size, overlay.bitmap)) {
    util::Logger::Warn("[OverlayBaker] Could not resize " + label);
    return std::nullopt;
  }
  ScaleAlpha(overlay.bitmap, spec.opacity);

  overlay.position = ResolveKeywordPosition(
      kFrameSize, Size{overlay.bitmap.width, overlay.bitmap.height}, spec.position, spec.margins);
  ApplyTiming(spec.timing, video_duration_s, overlay);
  return overlay;
}

}  // namespace clipforge::render
