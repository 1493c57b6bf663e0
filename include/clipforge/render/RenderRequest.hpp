// Repository: ClipForge-render
// Component: Render Request
// Purpose: Strongly typed, immutable view of a job's request_data.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_RENDER_REQUEST_HPP_
#define CLIPFORGE_RENDER_RENDER_REQUEST_HPP_

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace clipforge::render {

class RequestParseError : public std::runtime_error {
 public:
  explicit RequestParseError(const std::string& what) : std::runtime_error(what) {}
};

enum class VerticalAnchor { kTop, kCenter, kBottom };
enum class HorizontalAnchor { kLeft, kCenter, kRight };
enum class TextAlign { kLeft, kCenter, kRight };

// ["top"|"center"|"bottom", "left"|"center"|"right"] relative to the
// margin-reduced content box.
struct KeywordPosition {
  VerticalAnchor vertical = VerticalAnchor::kCenter;
  HorizontalAnchor horizontal = HorizontalAnchor::kCenter;
};

// [yCenter, xAnchor, boxWidth] in frame pixels. boxWidth doubles as the
// text-wrap width.
struct PixelPosition {
  int y_center = 0;
  int x_anchor = 0;
  int box_width = 0;
};

using PositioningDescriptor = std::variant<KeywordPosition, PixelPosition>;

// [top, right, bottom, left]
struct Margins {
  int top = 0;
  int right = 0;
  int bottom = 0;
  int left = 0;
};

struct VideoSettings {
  std::string style = "random";
  double duration_s = 15.0;
  double speed = 0.5;
  double exposure = 1.0;
  double brightness = 1.0;
  double contrast = 1.0;
  double saturation = 1.0;
  double fade_in_s = 0.0;
  double fade_out_s = 0.0;
  double blur = 0.0;
};

struct AudioSettings {
  std::string audio = "random";  // "none" disables audio
  double volume = 1.0;
  double fade_in_s = 2.0;
  double fade_out_s = 2.0;

  bool Enabled() const { return audio != "none"; }
};

// Shared time-window/fade fields of every overlay kind.
struct OverlayTiming {
  std::optional<double> start_time_s;  // Defaults to 0
  std::optional<double> end_time_s;    // Defaults to the video duration
  double fade_in_s = 0.0;
  double fade_out_s = 0.0;
};

struct TextOverlaySpec {
  std::string text;
  std::string font = "Arial";
  int font_size = 40;
  std::string font_color = "white";
  TextAlign align = TextAlign::kCenter;
  PositioningDescriptor position = KeywordPosition{};
  Margins margins{100, 50, 100, 50};
  double opacity = 1.0;
  OverlayTiming timing;
};

// Image assets (logo, image signature) are always keyword-positioned.
struct ImageOverlaySpec {
  std::string name;
  int size = 150;
  KeywordPosition position{VerticalAnchor::kBottom, HorizontalAnchor::kCenter};
  Margins margins{0, 25, 25, 0};
  double opacity = 1.0;
  OverlayTiming timing;
};

// A signature is either rendered text or an image from the signature directory.
using SignatureSpec = std::variant<TextOverlaySpec, ImageOverlaySpec>;

struct RenderRequest {
  VideoSettings video;
  std::optional<AudioSettings> audio;
  std::vector<TextOverlaySpec> text_overlays;
  std::optional<SignatureSpec> signature;
  std::optional<ImageOverlaySpec> logo;

  double RequiredSourceDurationSec() const { return video.duration_s * video.speed; }
};

// Parses request_data JSON. Absent fields take the defaults above; a speed
// <= 0 is replaced by 1.0. Throws RequestParseError on malformed JSON,
// wrongly typed fields, or an invalid positioning descriptor.
RenderRequest ParseRenderRequest(const std::string& request_data);

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_RENDER_REQUEST_HPP_
