// Repository: ClipForge-render
// Component: Transcoder
// Purpose: ffmpeg subprocess calls: lossless source trim and audio mux.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_MEDIA_TRANSCODER_HPP_
#define CLIPFORGE_MEDIA_TRANSCODER_HPP_

#include <stdexcept>
#include <string>
#include <vector>

#include "clipforge/util/ProcessRunner.hpp"

namespace clipforge::media {

// Non-zero exit (or launch failure) of an external tool. what() is the
// tool's stderr so it can be surfaced as the job's error message.
class ToolError : public std::runtime_error {
 public:
  ToolError(const std::string& command, const util::ProcessResult& result);

  int exit_code() const { return exit_code_; }
  int term_signal() const { return term_signal_; }
  const std::string& stderr_text() const { return stderr_text_; }
  const std::string& command() const { return command_; }

 private:
  std::string command_;
  int exit_code_;
  int term_signal_;
  std::string stderr_text_;
};

struct AudioMix {
  double volume = 1.0;
  double fade_in_s = 0.0;
  double fade_out_s = 0.0;
};

class Transcoder {
 public:
  virtual ~Transcoder() = default;

  // Stream-copies [start_s, start_s + duration_s) of |source| into |dest|.
  // Throws ToolError.
  virtual void Trim(const std::string& source, double start_s, double duration_s,
                    const std::string& dest) = 0;

  // Copies the video stream of |video|, re-encodes the first audio stream of
  // |audio| to AAC with |mix| applied, and stops at the shorter stream.
  // Throws ToolError.
  virtual void MuxAudio(const std::string& video, const std::string& audio, const AudioMix& mix,
                        double output_duration_s, const std::string& dest) = 0;
};

class FfmpegTranscoder : public Transcoder {
 public:
  FfmpegTranscoder(const util::ProcessRunner& runner, std::string ffmpeg_bin);

  void Trim(const std::string& source, double start_s, double duration_s,
            const std::string& dest) override;
  void MuxAudio(const std::string& video, const std::string& audio, const AudioMix& mix,
                double output_duration_s, const std::string& dest) override;

 private:
  void RunOrThrow(const std::vector<std::string>& argv);

  const util::ProcessRunner& runner_;
  std::string ffmpeg_bin_;
};

// Shortest decimal form ("2", "1.5", "12.345678").
std::string FormatSeconds(double value);

std::vector<std::string> BuildTrimCommand(const std::string& ffmpeg_bin, const std::string& source,
                                          double start_s, double duration_s,
                                          const std::string& dest);

// "volume=V,afade=t=in:d=I,afade=t=out:st=S:d=O". Each part appears only when
// it changes anything; the fade-out is dropped when it would start at or
// before 0. Empty when no filter is needed.
std::string BuildAudioFilter(const AudioMix& mix, double output_duration_s);

std::vector<std::string> BuildMuxCommand(const std::string& ffmpeg_bin, const std::string& video,
                                         const std::string& audio, const std::string& filter,
                                         const std::string& dest);

}  // namespace clipforge::media

#endif  // CLIPFORGE_MEDIA_TRANSCODER_HPP_
