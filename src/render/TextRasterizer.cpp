// Repository: ClipForge-render
// Component: Text Rasterizer
// Purpose: FreeType-backed measurement, greedy word wrap and text block rendering.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/TextRasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <ft2build.h>
#include FT_FREETYPE_H

#include "clipforge/util/Logger.hpp"

namespace clipforge::render {

std::unique_ptr<FontFace> FontFace::Load(const std::string& path, int pixel_size) {
  std::unique_ptr<FontFace> font(new FontFace());
  font->path_ = path;
  font->pixel_size_ = pixel_size;

  if (FT_Init_FreeType(&font->library_) != 0) {
    util::Logger::Error("[TextRasterizer] FT_Init_FreeType failed");
    font->library_ = nullptr;
    return nullptr;
  }
  FT_Error err = FT_New_Face(font->library_, path.c_str(), 0, &font->face_);
  if (err != 0 || !font->face_) {
    util::Logger::Warn("[TextRasterizer] Cannot load font '" + path + "' (FreeType error " +
                       std::to_string(err) + ")");
    font->face_ = nullptr;
    return nullptr;
  }
  if (FT_Select_Charmap(font->face_, FT_ENCODING_UNICODE) != 0) {
    util::Logger::Debug("[TextRasterizer] No unicode charmap in " + path);
  }
  err = FT_Set_Pixel_Sizes(font->face_, 0, static_cast<FT_UInt>(std::max(1, pixel_size)));
  if (err != 0) {
    util::Logger::Warn("[TextRasterizer] Cannot set size " + std::to_string(pixel_size) +
                       " on '" + path + "'");
    return nullptr;
  }

  font->ascender_ = static_cast<int>(font->face_->size->metrics.ascender >> 6);
  font->line_height_ = static_cast<int>(font->face_->size->metrics.height >> 6);
  if (font->line_height_ <= 0) font->line_height_ = pixel_size;
  return font;
}

FontFace::~FontFace() {
  if (face_) FT_Done_Face(face_);
  if (library_) FT_Done_FreeType(library_);
}

int FontFace::MeasureWidth(const std::string& utf8) {
  const bool kerning = FT_HAS_KERNING(face_);
  FT_UInt previous = 0;
  long width = 0;
  for (uint32_t cp : DecodeUtf8(utf8)) {
    const FT_UInt glyph = FT_Get_Char_Index(face_, cp);
    if (kerning && previous && glyph) {
      FT_Vector delta;
      if (FT_Get_Kerning(face_, previous, glyph, FT_KERNING_DEFAULT, &delta) == 0) {
        width += delta.x >> 6;
      }
    }
    if (FT_Load_Glyph(face_, glyph, FT_LOAD_DEFAULT) == 0) {
      width += face_->glyph->advance.x >> 6;
    }
    previous = glyph;
  }
  return static_cast<int>(width);
}

void FontFace::DrawLine(const std::string& utf8, int pen_x, int baseline_y,
                        std::vector<uint8_t>& coverage, int canvas_width, int canvas_height) {
  const bool kerning = FT_HAS_KERNING(face_);
  FT_UInt previous = 0;
  for (uint32_t cp : DecodeUtf8(utf8)) {
    const FT_UInt glyph = FT_Get_Char_Index(face_, cp);
    if (kerning && previous && glyph) {
      FT_Vector delta;
      if (FT_Get_Kerning(face_, previous, glyph, FT_KERNING_DEFAULT, &delta) == 0) {
        pen_x += static_cast<int>(delta.x >> 6);
      }
    }
    previous = glyph;
    if (FT_Load_Glyph(face_, glyph, FT_LOAD_DEFAULT) != 0) continue;
    FT_GlyphSlot slot = face_->glyph;
    if (slot->format != FT_GLYPH_FORMAT_BITMAP &&
        FT_Render_Glyph(slot, FT_RENDER_MODE_NORMAL) != 0) {
      pen_x += static_cast<int>(slot->advance.x >> 6);
      continue;
    }

    const FT_Bitmap& bm = slot->bitmap;
    const int left = pen_x + slot->bitmap_left;
    const int top = baseline_y - slot->bitmap_top;
    for (unsigned int row = 0; row < bm.rows; ++row) {
      const int y = top + static_cast<int>(row);
      if (y < 0 || y >= canvas_height) continue;
      const unsigned char* src = bm.buffer + static_cast<long>(row) * bm.pitch;
      for (unsigned int col = 0; col < bm.width; ++col) {
        const int x = left + static_cast<int>(col);
        if (x < 0 || x >= canvas_width) continue;
        uint8_t value = 0;
        if (bm.pixel_mode == FT_PIXEL_MODE_MONO) {
          value = (src[col >> 3] & (0x80 >> (col & 7))) ? 255 : 0;
        } else if (bm.pixel_mode == FT_PIXEL_MODE_GRAY) {
          value = src[col];
        } else {
          continue;
        }
        uint8_t& dst = coverage[static_cast<size_t>(y) * canvas_width + x];
        dst = std::max(dst, value);
      }
    }
    pen_x += static_cast<int>(slot->advance.x >> 6);
  }
}

std::vector<uint32_t> DecodeUtf8(const std::string& utf8) {
  std::vector<uint32_t> out;
  out.reserve(utf8.size());
  size_t i = 0;
  while (i < utf8.size()) {
    const unsigned char c = static_cast<unsigned char>(utf8[i]);
    int extra = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      cp = c;
    } else if ((c & 0xE0) == 0xC0) {
      cp = c & 0x1F;
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      cp = c & 0x0F;
      extra = 2;
    } else if ((c & 0xF8) == 0xF0) {
      cp = c & 0x07;
      extra = 3;
    } else {
      out.push_back(0xFFFD);
      ++i;
      continue;
    }
    if (i + static_cast<size_t>(extra) >= utf8.size()) {
      out.push_back(0xFFFD);
      break;
    }
    bool valid = true;
    for (int k = 1; k <= extra; ++k) {
      const unsigned char cc = static_cast<unsigned char>(utf8[i + k]);
      if ((cc & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!valid) {
      out.push_back(0xFFFD);
      ++i;
      continue;
    }
    out.push_back(cp);
    i += static_cast<size_t>(extra) + 1;
  }
  return out;
}

std::vector<std::string> WrapText(const std::string& text, int max_width,
                                  const std::function<int(const std::string&)>& measure) {
  std::vector<std::string> words;
  std::istringstream in(text);
  std::string word;
  while (in >> word) words.push_back(word);

  std::vector<std::string> lines;
  if (words.empty()) return lines;

  std::string current = words[0];
  for (size_t i = 1; i < words.size(); ++i) {
    const std::string candidate = current + " " + words[i];
    if (measure(candidate) <= max_width) {
      current = candidate;
    } else {
      lines.push_back(current);
      current = words[i];
    }
  }
  lines.push_back(current);
  return lines;
}

RgbaBitmap RenderTextBlock(FontFace& face, const std::vector<std::string>& lines,
                           const TextBlockStyle& style) {
  if (lines.empty()) return RgbaBitmap();

  std::vector<int> widths;
  int block_width = 0;
  for (const auto& line : lines) {
    widths.push_back(face.MeasureWidth(line));
    block_width = std::max(block_width, widths.back());
  }

  // Generous padding: glyph bitmaps may extend past the pen box.
  const int pad = std::max(4, face.pixel_size());
  const double advance = face.line_height() + style.line_spacing;
  const int canvas_w = block_width + 2 * pad;
  const int canvas_h =
      static_cast<int>(std::ceil(advance * static_cast<double>(lines.size()))) + 2 * pad;
  std::vector<uint8_t> coverage(static_cast<size_t>(canvas_w) * canvas_h, 0);

  for (size_t i = 0; i < lines.size(); ++i) {
    int offset = 0;
    if (style.align == TextAlign::kCenter) {
      offset = (block_width - widths[i]) / 2;
    } else if (style.align == TextAlign::kRight) {
      offset = block_width - widths[i];
    }
    const int baseline =
        pad + face.ascender() + static_cast<int>(std::lround(advance * static_cast<double>(i)));
    face.DrawLine(lines[i], pad + offset, baseline, coverage, canvas_w, canvas_h);
  }

  // Tight crop to inked pixels.
  int min_x = canvas_w, min_y = canvas_h, max_x = -1, max_y = -1;
  for (int y = 0; y < canvas_h; ++y) {
    const uint8_t* row = coverage.data() + static_cast<size_t>(y) * canvas_w;
    for (int x = 0; x < canvas_w; ++x) {
      if (row[x] == 0) continue;
      min_x = std::min(min_x, x);
      max_x = std::max(max_x, x);
      min_y = std::min(min_y, y);
      max_y = std::max(max_y, y);
    }
  }
  if (max_x < 0) return RgbaBitmap();

  const double opacity = std::clamp(style.opacity, 0.0, 1.0);
  const int text_alpha = static_cast<int>(255.0 * opacity);
  RgbaBitmap out(max_x - min_x + 1, max_y - min_y + 1);
  for (int y = 0; y < out.height; ++y) {
    for (int x = 0; x < out.width; ++x) {
      const uint8_t cov = coverage[static_cast<size_t>(y + min_y) * canvas_w + (x + min_x)];
      uint8_t* px = out.Pixel(x, y);
      px[0] = style.color.r;
      px[1] = style.color.g;
      px[2] = style.color.b;
      px[3] = static_cast<uint8_t>((cov * text_alpha + 127) / 255);
    }
  }
  return out;
}

}  // namespace clipforge::render
