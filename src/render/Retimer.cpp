// Repository: ClipForge-render
// Component: Speed Retimer
// Purpose: Maps source frame indices to output frame copies under a speed factor.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/Retimer.hpp"

#include <algorithm>
#include <cmath>

namespace clipforge::render {

Retimer::Retimer(double speed, int64_t total_frames)
    : speed_(speed > 0.0 ? speed : 1.0), total_frames_(std::max<int64_t>(0, total_frames)) {}

int64_t Retimer::CopiesFor(int64_t source_index) const {
  const double raw = std::floor(static_cast<double>(source_index + 1) / speed_);
  const int64_t target = std::min(total_frames_, static_cast<int64_t>(raw));
  return std::max<int64_t>(0, target - written_);
}

int64_t Retimer::SourceFramesNeeded() const {
  return static_cast<int64_t>(std::ceil(static_cast<double>(total_frames_) * speed_)) + 1;
}

}  // namespace clipforge::render
