// Repository: ClipForge-render
// Component: Render Request
// Purpose: Strongly typed, immutable view of a job's request_data.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/RenderRequest.hpp"

#include <cmath>
#include <limits>

#include <nlohmann/json.hpp>

namespace clipforge::render {

namespace {

using nlohmann::json;

bool Present(const json& obj, const char* key) {
  auto it = obj.find(key);
  return it != obj.end() && !it->is_null();
}

double GetNumber(const json& obj, const char* key, double fallback, const std::string& where) {
  if (!Present(obj, key)) return fallback;
  const json& v = obj.at(key);
  if (!v.is_number()) {
    throw RequestParseError(where + "." + key + " must be a number");
  }
  return v.get<double>();
}

int FloorToInt(double value, const std::string& field) {
  const double floored = std::floor(value);
  if (!std::isfinite(floored) || floored < std::numeric_limits<int>::min() ||
      floored > std::numeric_limits<int>::max()) {
    throw RequestParseError(field + " is out of range");
  }
  return static_cast<int>(floored);
}

int GetInt(const json& obj, const char* key, int fallback, const std::string& where) {
  return FloorToInt(GetNumber(obj, key, fallback, where), where + "." + key);
}

std::string GetString(const json& obj, const char* key, const std::string& fallback,
                      const std::string& where) {
  if (!Present(obj, key)) return fallback;
  const json& v = obj.at(key);
  if (!v.is_string()) {
    throw RequestParseError(where + "." + key + " must be a string");
  }
  return v.get<std::string>();
}

std::optional<double> GetOptionalNumber(const json& obj, const char* key, const std::string& where) {
  if (!Present(obj, key)) return std::nullopt;
  return GetNumber(obj, key, 0.0, where);
}

const json* GetObject(const json& obj, const char* key, const std::string& where) {
  if (!Present(obj, key)) return nullptr;
  const json& v = obj.at(key);
  if (!v.is_object()) {
    throw RequestParseError(where + "." + key + " must be an object");
  }
  return &v;
}

VerticalAnchor ParseVertical(const std::string& s, const std::string& where) {
  if (s == "top") return VerticalAnchor::kTop;
  if (s == "center") return VerticalAnchor::kCenter;
  if (s == "bottom") return VerticalAnchor::kBottom;
  throw RequestParseError(where + ".positionxy[0] must be top, center or bottom (got '" + s + "')");
}

HorizontalAnchor ParseHorizontal(const std::string& s, const std::string& where) {
  if (s == "left") return HorizontalAnchor::kLeft;
  if (s == "center") return HorizontalAnchor::kCenter;
  if (s == "right") return HorizontalAnchor::kRight;
  throw RequestParseError(where + ".positionxy[1] must be left, center or right (got '" + s + "')");
}

TextAlign ParseAlign(const std::string& s, const std::string& where) {
  if (s == "left") return TextAlign::kLeft;
  if (s == "center") return TextAlign::kCenter;
  if (s == "right") return TextAlign::kRight;
  throw RequestParseError(where + ".font_align must be left, center or right (got '" + s + "')");
}

// Pixel mode iff exactly three numeric entries; keyword mode iff two strings.
PositioningDescriptor ParsePosition(const json& obj, const PositioningDescriptor& fallback,
                                    const std::string& where) {
  if (!Present(obj, "positionxy")) return fallback;
  const json& v = obj.at("positionxy");
  if (!v.is_array()) {
    throw RequestParseError(where + ".positionxy must be a list");
  }

  bool all_numbers = !v.empty();
  bool all_strings = !v.empty();
  for (const auto& item : v) {
    all_numbers = all_numbers && item.is_number();
    all_strings = all_strings && item.is_string();
  }

  if (v.size() == 3 && all_numbers) {
    PixelPosition p;
    p.y_center = FloorToInt(v[0].get<double>(), where + ".positionxy[0]");
    p.x_anchor = FloorToInt(v[1].get<double>(), where + ".positionxy[1]");
    p.box_width = FloorToInt(v[2].get<double>(), where + ".positionxy[2]");
    return p;
  }
  if (v.size() == 2 && all_strings) {
    KeywordPosition k;
    k.vertical = ParseVertical(v[0].get<std::string>(), where);
    k.horizontal = ParseHorizontal(v[1].get<std::string>(), where);
    return k;
  }
  throw RequestParseError(where +
                          ".positionxy must be two keywords or three numbers [y, x, width]");
}

Margins ParseMargins(const json& obj, const Margins& fallback, const std::string& where) {
  if (!Present(obj, "margin")) return fallback;
  const json& v = obj.at("margin");
  if (!v.is_array() || v.size() != 4) {
    throw RequestParseError(where + ".margin must be [top, right, bottom, left]");
  }
  for (const auto& item : v) {
    if (!item.is_number()) {
      throw RequestParseError(where + ".margin entries must be numbers");
    }
  }
  Margins m;
  m.top = FloorToInt(v[0].get<double>(), where + ".margin[0]");
  m.right = FloorToInt(v[1].get<double>(), where + ".margin[1]");
  m.bottom = FloorToInt(v[2].get<double>(), where + ".margin[2]");
  m.left = FloorToInt(v[3].get<double>(), where + ".margin[3]");
  return m;
}

OverlayTiming ParseTiming(const json& obj, const std::string& where) {
  OverlayTiming t;
  t.start_time_s = GetOptionalNumber(obj, "start_time", where);
  t.end_time_s = GetOptionalNumber(obj, "end_time", where);
  t.fade_in_s = GetNumber(obj, "fade_in", 0.0, where);
  t.fade_out_s = GetNumber(obj, "fade_out", 0.0, where);
  return t;
}

TextOverlaySpec ParseTextOverlay(const json& obj, double default_opacity, const std::string& where) {
  if (!obj.is_object()) {
    throw RequestParseError(where + " must be an object");
  }
  TextOverlaySpec t;
  t.text = GetString(obj, "text", "", where);
  t.font = GetString(obj, "font", t.font, where);
  t.font_size = GetInt(obj, "font_size", t.font_size, where);
  t.font_color = GetString(obj, "font_color", t.font_color, where);
  t.align = ParseAlign(GetString(obj, "font_align", "center", where), where);
  t.position = ParsePosition(obj, t.position, where);
  t.margins = ParseMargins(obj, t.margins, where);
  t.opacity = GetNumber(obj, "opacity", default_opacity, where);
  t.timing = ParseTiming(obj, where);
  if (t.font_size <= 0) {
    throw RequestParseError(where + ".font_size must be positive");
  }
  return t;
}

ImageOverlaySpec ParseImageOverlay(const json& obj, const std::string& where) {
  ImageOverlaySpec s;
  s.name = GetString(obj, "name", "", where);
  s.size = GetInt(obj, "size", s.size, where);
  const PositioningDescriptor pos = ParsePosition(obj, s.position, where);
  if (!std::holds_alternative<KeywordPosition>(pos)) {
    throw RequestParseError(where + ".positionxy must use keyword positioning");
  }
  s.position = std::get<KeywordPosition>(pos);
  s.margins = ParseMargins(obj, s.margins, where);
  s.opacity = GetNumber(obj, "opacity", s.opacity, where);
  s.timing = ParseTiming(obj, where);
  return s;
}

}  // namespace

RenderRequest ParseRenderRequest(const std::string& request_data) {
  json root;
  try {
    root = json::parse(request_data);
  } catch (const json::parse_error& e) {
    throw RequestParseError(std::string("request_data is not valid JSON: ") + e.what());
  }
  if (!root.is_object()) {
    throw RequestParseError("request_data must be a JSON object");
  }

  RenderRequest req;

  if (const json* video = GetObject(root, "video", "request")) {
    VideoSettings& v = req.video;
    v.style = GetString(*video, "style", v.style, "video");
    v.duration_s = GetNumber(*video, "duration", v.duration_s, "video");
    v.speed = GetNumber(*video, "speed", v.speed, "video");
    v.exposure = GetNumber(*video, "exposure", v.exposure, "video");
    v.brightness = GetNumber(*video, "brightness", v.brightness, "video");
    v.contrast = GetNumber(*video, "contrast", v.contrast, "video");
    v.saturation = GetNumber(*video, "saturation", v.saturation, "video");
    v.fade_in_s = GetNumber(*video, "fade_in", v.fade_in_s, "video");
    v.fade_out_s = GetNumber(*video, "fade_out", v.fade_out_s, "video");
    v.blur = GetNumber(*video, "blur", v.blur, "video");
  }
  if (req.video.speed <= 0.0) req.video.speed = 1.0;
  if (req.video.duration_s <= 0.0) {
    throw RequestParseError("video.duration must be positive");
  }

  if (const json* audio = GetObject(root, "audio", "request")) {
    AudioSettings a;
    a.audio = GetString(*audio, "audio", a.audio, "audio");
    a.volume = GetNumber(*audio, "volume", a.volume, "audio");
    a.fade_in_s = GetNumber(*audio, "fade_in", a.fade_in_s, "audio");
    a.fade_out_s = GetNumber(*audio, "fade_out", a.fade_out_s, "audio");
    req.audio = a;
  }

  if (Present(root, "text_overlays")) {
    const json& list = root.at("text_overlays");
    if (!list.is_array()) {
      throw RequestParseError("text_overlays must be a list");
    }
    for (size_t i = 0; i < list.size(); ++i) {
      req.text_overlays.push_back(
          ParseTextOverlay(list[i], 1.0, "text_overlays[" + std::to_string(i) + "]"));
    }
  }

  if (const json* sig = GetObject(root, "signature", "request")) {
    if (!Present(*sig, "text") && Present(*sig, "name")) {
      ImageOverlaySpec image = ParseImageOverlay(*sig, "signature");
      if (!Present(*sig, "opacity")) image.opacity = 0.5;
      req.signature = image;
    } else {
      req.signature = ParseTextOverlay(*sig, 0.5, "signature");
    }
  }

  if (const json* logo = GetObject(root, "logo", "request")) {
    req.logo = ParseImageOverlay(*logo, "logo");
  }

  return req;
}

}  // namespace clipforge::render
