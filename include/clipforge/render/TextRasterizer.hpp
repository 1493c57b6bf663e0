// Repository: ClipForge-render
// Component: Text Rasterizer
// Purpose: FreeType-backed measurement, greedy word wrap and text block rendering.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_TEXT_RASTERIZER_HPP_
#define CLIPFORGE_RENDER_TEXT_RASTERIZER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "clipforge/render/ColorParser.hpp"
#include "clipforge/render/Image.hpp"
#include "clipforge/render/RenderRequest.hpp"

struct FT_LibraryRec_;
struct FT_FaceRec_;

namespace clipforge::render {

// One FreeType face at a fixed pixel size. Owns its own FT_Library so faces
// are independent of each other.
class FontFace {
 public:
  // Returns nullptr (and logs) if |path| cannot be loaded as a font.
  static std::unique_ptr<FontFace> Load(const std::string& path, int pixel_size);

  ~FontFace();

  FontFace(const FontFace&) = delete;
  FontFace& operator=(const FontFace&) = delete;

  // Horizontal advance of |utf8| in pixels (kerning applied).
  int MeasureWidth(const std::string& utf8);

  int pixel_size() const { return pixel_size_; }
  int ascender() const { return ascender_; }
  int line_height() const { return line_height_; }
  const std::string& path() const { return path_; }

  // Renders |utf8| into an 8-bit coverage canvas of |canvas_width| with the
  // pen starting at (pen_x, baseline_y). Coverage is max-combined.
  void DrawLine(const std::string& utf8, int pen_x, int baseline_y,
                std::vector<uint8_t>& coverage, int canvas_width, int canvas_height);

 private:
  FontFace() = default;

  FT_LibraryRec_* library_ = nullptr;
  FT_FaceRec_* face_ = nullptr;
  std::string path_;
  int pixel_size_ = 0;
  int ascender_ = 0;
  int line_height_ = 0;
};

// Decodes UTF-8 into code points. Invalid bytes become U+FFFD.
std::vector<uint32_t> DecodeUtf8(const std::string& utf8);

// Greedy word wrap: words (whitespace separated) are appended to the current
// line while measure(line) <= max_width; a single over-long word still gets
// its own line. Returns no lines for blank text.
std::vector<std::string> WrapText(const std::string& text, int max_width,
                                  const std::function<int(const std::string&)>& measure);

struct TextBlockStyle {
  Rgb color{255, 255, 255};
  double opacity = 1.0;
  TextAlign align = TextAlign::kCenter;
  double line_spacing = 0.0;  // Extra pixels between lines
};

// Renders |lines| as one block, each line aligned within the widest line,
// tightly cropped to the inked pixels. Alpha = coverage * opacity.
// Returns an empty bitmap if nothing was inked.
RgbaBitmap RenderTextBlock(FontFace& face, const std::vector<std::string>& lines,
                           const TextBlockStyle& style);

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_TEXT_RASTERIZER_HPP_
