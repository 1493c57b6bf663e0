// Repository: ClipForge-render
// Component: Position Resolver
// Purpose: Maps overlay size + positioning descriptor to a top-left frame coordinate.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_POSITION_RESOLVER_HPP_
#define CLIPFORGE_RENDER_POSITION_RESOLVER_HPP_

#include "clipforge/render/RenderRequest.hpp"

namespace clipforge::render {

struct Size {
  int width = 0;
  int height = 0;
};

// Top-left corner in frame pixels; may be negative or past the frame edge
// (compositing clips).
struct Point {
  int y = 0;
  int x = 0;

  bool operator==(const Point& other) const { return y == other.y && x == other.x; }
};

// Integer division rounding toward negative infinity.
constexpr int FloorDiv(int a, int b) {
  const int q = a / b;
  return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

// Keyword mode: anchors inside the content box (frame minus margins).
Point ResolveKeywordPosition(Size frame, Size overlay, const KeywordPosition& position,
                             const Margins& margins);

// Pixel mode: y centred on y_center; x from |align| within
// [x_anchor, x_anchor + box_width]. Margins do not apply.
Point ResolvePixelPosition(Size overlay, const PixelPosition& position, TextAlign align);

// Dispatches on the descriptor's mode.
Point ResolvePosition(Size frame, Size overlay, const PositioningDescriptor& descriptor,
                      const Margins& margins, TextAlign align);

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_POSITION_RESOLVER_HPP_
