// Repository: ClipForge-render
// Component: Output Retention
// Purpose: Deletes rendered outputs older than the retention window.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_JOBS_OUTPUT_CLEANUP_HPP_
#define CLIPFORGE_JOBS_OUTPUT_CLEANUP_HPP_

#include <chrono>
#include <string>

namespace clipforge::jobs {

struct CleanupResult {
  int files_deleted = 0;
  int errors = 0;
};

// Removes regular files directly inside |outputs_dir| whose modification time
// is more than |retention| before |now|. Subdirectories are left alone.
// A missing directory yields {0, 0}.
CleanupResult CleanupOldOutputs(const std::string& outputs_dir,
                                std::chrono::hours retention,
                                std::chrono::system_clock::time_point now =
                                    std::chrono::system_clock::now());

// Removes `*.lock` markers directly inside |font_cache_dir|. A worker that
// dies while downloading a font leaves its marker behind, and every later
// render would wait out the lock timeout on it. Only safe while no worker is
// running. Returns the number of markers removed; a missing directory yields 0.
int RemoveStaleFontLocks(const std::string& font_cache_dir);

}  // namespace clipforge::jobs

#endif  // CLIPFORGE_JOBS_OUTPUT_CLEANUP_HPP_
