// Repository: ClipForge-render
// Component: Image Buffers
// Purpose: Packed RGB frames and RGBA overlay bitmaps used by the render pipeline.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_IMAGE_HPP_
#define CLIPFORGE_RENDER_IMAGE_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace clipforge::render {

// Fixed output shape: portrait 9:16.
constexpr int kOutputWidth = 1080;
constexpr int kOutputHeight = 1920;

// Packed RGB24, row-major, stride == width * 3.
struct RgbFrame {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> data;

  RgbFrame() = default;
  RgbFrame(int w, int h) : width(w), height(h), data(static_cast<size_t>(w) * h * 3, 0) {}

  bool Empty() const { return width <= 0 || height <= 0 || data.empty(); }
  size_t Stride() const { return static_cast<size_t>(width) * 3; }
  uint8_t* Pixel(int x, int y) { return data.data() + (static_cast<size_t>(y) * width + x) * 3; }
  const uint8_t* Pixel(int x, int y) const {
    return data.data() + (static_cast<size_t>(y) * width + x) * 3;
  }
};

// Packed RGBA32 (straight alpha), row-major, stride == width * 4.
struct RgbaBitmap {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> data;

  RgbaBitmap() = default;
  RgbaBitmap(int w, int h) : width(w), height(h), data(static_cast<size_t>(w) * h * 4, 0) {}

  bool Empty() const { return width <= 0 || height <= 0 || data.empty(); }
  uint8_t* Pixel(int x, int y) { return data.data() + (static_cast<size_t>(y) * width + x) * 4; }
  const uint8_t* Pixel(int x, int y) const {
    return data.data() + (static_cast<size_t>(y) * width + x) * 4;
  }
};

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_IMAGE_HPP_
