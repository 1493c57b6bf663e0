// Repository: ClipForge-render
// Component: Render Errors
// Purpose: Job-fatal render failures surfaced as the job's error message.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_RENDER_ERROR_HPP_
#define CLIPFORGE_RENDER_RENDER_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace clipforge::render {

// Input/selection and pipeline failures. what() is user-facing.
class RenderError : public std::runtime_error {
 public:
  explicit RenderError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_RENDER_ERROR_HPP_
