// Repository: ClipForge-render
// Component: Subprocess Runner
// Purpose: Runs external tools (ffmpeg, ffprobe, curl) and captures their output.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_UTIL_PROCESS_RUNNER_HPP_
#define CLIPFORGE_UTIL_PROCESS_RUNNER_HPP_

#include <string>
#include <vector>

namespace clipforge::util {

struct ProcessResult {
  int exit_code = -1;       // Exit status when the child exited normally
  int term_signal = 0;      // Signal number when the child was killed
  bool launched = false;    // False if fork/exec failed
  std::string stdout_text;
  std::string stderr_text;

  bool Succeeded() const { return launched && term_signal == 0 && exit_code == 0; }
};

// ProcessRunner executes argv[0] via PATH lookup with stdin closed and both
// stdout and stderr captured through pipes. Blocks until the child exits.
//
// Thread Safety:
// - Run() is reentrant; each call owns its pipes and child.
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  virtual ProcessResult Run(const std::vector<std::string>& argv) const;
};

// Renders argv as a shell-like string for logs.
std::string JoinCommand(const std::vector<std::string>& argv);

}  // namespace clipforge::util

#endif  // CLIPFORGE_UTIL_PROCESS_RUNNER_HPP_
