// Repository: ClipForge-render
// Component: Frame Loop
// Purpose: Per-source-frame transform, retime, composite, fade and emit.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/FrameLoop.hpp"

#include "clipforge/render/RenderError.hpp"
#include "clipforge/render/Retimer.hpp"
#include "clipforge/util/Logger.hpp"

namespace clipforge::render {

FrameLoopResult RunFrameLoop(FrameSource& source, FrameSink& sink,
                             const std::vector<PrebakedOverlay>& overlays,
                             const FrameLoopSettings& settings,
                             const ProgressCallback& on_progress) {
  FrameLoopResult result;
  Retimer retimer(settings.speed, settings.total_frames);
  FrameScaler scaler;
  GaussianBlur blur(settings.blur_kernel);

  RgbFrame decoded;
  RgbFrame processed;
  RgbFrame output;
  bool have_processed = false;

  const int64_t source_limit = retimer.SourceFramesNeeded();
  for (int64_t i = 0; i < source_limit && !retimer.Done(); ++i) {
    if (source.ReadFrame(decoded)) {
      result.source_frames_read++;
      if (!scaler.ResizeAndCrop(decoded, processed)) {
        throw RenderError("Could not scale source frame " + std::to_string(i));
      }
      ApplyColorEffects(processed, settings.effects);
      if (!blur.Apply(processed)) {
        throw RenderError("Could not blur source frame " + std::to_string(i));
      }
      have_processed = true;
    } else {
      if (!have_processed) {
        util::Logger::Warn("[FrameLoop] Source produced no frame at index " + std::to_string(i) +
                           ", stopping");
        break;
      }
      result.repeated_frames++;
    }

    const int64_t copies = retimer.CopiesFor(i);
    for (int64_t c = 0; c < copies; ++c) {
      const double t = static_cast<double>(retimer.written()) / settings.fps;
      output = processed;
      if (!overlays.empty()) {
        CompositeOverlays(output, overlays, t);
      }
      ApplyMasterFade(output, MasterFadeAlpha(t, settings.duration_s, settings.fade_in_s,
                                              settings.fade_out_s));
      if (!sink.WriteFrame(output)) {
        throw RenderError("Failed to write output frame " + std::to_string(retimer.written()));
      }
      retimer.RecordWritten();
    }

    if ((i + 1) % kProgressIntervalFrames == 0 && on_progress && settings.total_frames > 0) {
      on_progress(static_cast<int>(retimer.written() * kFrameLoopProgressCap /
                                   settings.total_frames));
    }
  }

  result.frames_written = retimer.written();
  if (result.repeated_frames > 0) {
    util::Logger::Debug("[FrameLoop] Covered " + std::to_string(result.repeated_frames) +
                        " missing source frames with the previous frame");
  }
  return result;
}

}  // namespace clipforge::render
