// Repository: ClipForge-render
// Component: Colour Parser
// Purpose: Parses overlay font_color strings into RGB triples.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_COLOR_PARSER_HPP_
#define CLIPFORGE_RENDER_COLOR_PARSER_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace clipforge::render {

struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
  bool operator!=(const Rgb& o) const { return !(*this == o); }
};

// Accepts CSS colour names (case-insensitive), "#rgb", "#rrggbb" and
// "rgb(r, g, b)". Returns nullopt for anything else.
std::optional<Rgb> ParseColor(const std::string& text);

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_COLOR_PARSER_HPP_
