// Repository: ClipForge-render
// Component: Speed Retimer
// Purpose: Maps source frame indices to output frame copies under a speed factor.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_RETIMER_HPP_
#define CLIPFORGE_RENDER_RETIMER_HPP_

#include <cstdint>

namespace clipforge::render {

// Retimer tracks the running output total for a speed-changed render.
//
// After processing source frame i the output should hold
// min(floor((i + 1) / speed), total_frames) frames. CopiesFor(i) returns the
// difference from what has been written so far:
//   speed < 1 → some source frames are emitted more than once
//   speed > 1 → some source frames are emitted zero times
// Because targets are derived from the index alone, the written total reaches
// total_frames exactly once enough source frames are supplied.
class Retimer {
 public:
  Retimer(double speed, int64_t total_frames);

  // Number of copies of processed source frame |source_index| to emit now.
  int64_t CopiesFor(int64_t source_index) const;

  void RecordWritten(int64_t count = 1) { written_ += count; }

  int64_t written() const { return written_; }
  int64_t total_frames() const { return total_frames_; }
  double speed() const { return speed_; }
  bool Done() const { return written_ >= total_frames_; }

  // Upper bound on source frames that can contribute output.
  int64_t SourceFramesNeeded() const;

 private:
  double speed_;
  int64_t total_frames_;
  int64_t written_ = 0;
};

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_RETIMER_HPP_
