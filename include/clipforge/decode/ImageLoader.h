// Repository: ClipForge-render
// Component: Image Loader
// Purpose: Decodes still images (PNG, JPEG, WebP, ...) to RGBA and thumbnails them.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_DECODE_IMAGE_LOADER_H_
#define CLIPFORGE_DECODE_IMAGE_LOADER_H_

#include <string>

#include "clipforge/render/Image.hpp"

namespace clipforge::decode {

// Decodes the first frame of |path| into straight-alpha RGBA. Images without
// an alpha channel come back fully opaque.
// Returns false (and logs) if the file cannot be opened or decoded.
bool LoadImageRgba(const std::string& path, render::RgbaBitmap& out);

// Target size that fits |width|x|height| inside |max_side| square while
// keeping aspect ratio. Never enlarges.
void ThumbnailSize(int width, int height, int max_side, int& out_width, int& out_height);

// Lanczos downscale of |in| to fit |max_side|. Returns false if the scaler
// cannot be created. Images already within bounds are copied unchanged.
bool ThumbnailRgba(const render::RgbaBitmap& in, int max_side, render::RgbaBitmap& out);

}  // namespace clipforge::decode

#endif  // CLIPFORGE_DECODE_IMAGE_LOADER_H_
