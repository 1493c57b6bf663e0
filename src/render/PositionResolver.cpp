// Repository: ClipForge-render
// Component: Position Resolver
// Purpose: Maps overlay size + positioning descriptor to a top-left frame coordinate.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/PositionResolver.hpp"

#include <variant>

namespace clipforge::render {

Point ResolveKeywordPosition(Size frame, Size overlay, const KeywordPosition& position,
                             const Margins& margins) {
  const int content_x = margins.left;
  const int content_y = margins.top;
  const int content_w = frame.width - margins.left - margins.right;
  const int content_h = frame.height - margins.top - margins.bottom;

  Point p;
  switch (position.vertical) {
    case VerticalAnchor::kTop:
      p.y = content_y;
      break;
    case VerticalAnchor::kBottom:
      p.y = content_y + content_h - overlay.height;
      break;
    case VerticalAnchor::kCenter:
      p.y = content_y + FloorDiv(content_h - overlay.height, 2);
      break;
  }
  switch (position.horizontal) {
    case HorizontalAnchor::kLeft:
      p.x = content_x;
      break;
    case HorizontalAnchor::kRight:
      p.x = content_x + content_w - overlay.width;
      break;
    case HorizontalAnchor::kCenter:
      p.x = content_x + FloorDiv(content_w - overlay.width, 2);
      break;
  }
  return p;
}

Point ResolvePixelPosition(Size overlay, const PixelPosition& position, TextAlign align) {
  Point p;
  p.y = position.y_center - FloorDiv(overlay.height, 2);
  switch (align) {
    case TextAlign::kLeft:
      p.x = position.x_anchor;
      break;
    case TextAlign::kRight:
      p.x = position.x_anchor + position.box_width - overlay.width;
      break;
    case TextAlign::kCenter:
      p.x = position.x_anchor + FloorDiv(position.box_width - overlay.width, 2);
      break;
  }
  return p;
}

Point ResolvePosition(Size frame, Size overlay, const PositioningDescriptor& descriptor,
                      const Margins& margins, TextAlign align) {
  if (const auto* pixel = std::get_if<PixelPosition>(&descriptor)) {
    return ResolvePixelPosition(overlay, *pixel, align);
  }
  return ResolveKeywordPosition(frame, overlay, std::get<KeywordPosition>(descriptor), margins);
}

}  // namespace clipforge::render
