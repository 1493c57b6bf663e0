// Repository: ClipForge-render
// Component: Frame Loop
// Purpose: Per-source-frame transform, retime, composite, fade and emit.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_FRAME_LOOP_HPP_
#define CLIPFORGE_RENDER_FRAME_LOOP_HPP_

#include <cstdint>
#include <functional>
#include <vector>

#include "clipforge/render/Compositor.hpp"
#include "clipforge/render/FrameIO.hpp"
#include "clipforge/render/FrameTransform.hpp"

namespace clipforge::render {

// Source frames between progress reports.
constexpr int kProgressIntervalFrames = 30;
// Progress ceiling while frames are still being produced.
constexpr int kFrameLoopProgressCap = 95;

struct FrameLoopSettings {
  double speed = 1.0;
  double fps = 30.0;          // Output rate == source rate
  int64_t total_frames = 0;   // round(duration * fps)
  double duration_s = 0.0;    // Output duration (overlay/fade reference)
  ColorEffects effects;
  int blur_kernel = 0;        // 0 = no blur
  double fade_in_s = 0.0;
  double fade_out_s = 0.0;
};

struct FrameLoopResult {
  int64_t frames_written = 0;
  int64_t source_frames_read = 0;  // Successful decodes
  int64_t repeated_frames = 0;     // Decode failures covered by the last frame
};

using ProgressCallback = std::function<void(int progress)>;

// Runs the frame loop until total_frames have been written or the source
// cannot contribute any more.
//
// For source index i:
//   1. decode (on failure reuse the last processed frame; stop if none)
//   2. crop/scale to 9:16, colour effects, blur
//   3. emit floor((i+1)/speed) - written copies, capped at total_frames;
//      each copy gets overlays at t = written/fps, then the master fade
//   4. every kProgressIntervalFrames source frames report
//      floor(written/total * 95)
//
// Throws RenderError if the sink rejects a frame or a frame cannot be scaled.
FrameLoopResult RunFrameLoop(FrameSource& source, FrameSink& sink,
                             const std::vector<PrebakedOverlay>& overlays,
                             const FrameLoopSettings& settings,
                             const ProgressCallback& on_progress);

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_FRAME_LOOP_HPP_
