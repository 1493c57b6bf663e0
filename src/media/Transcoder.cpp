// Repository: ClipForge-render
// Component: Transcoder
// Purpose: ffmpeg subprocess calls: lossless source trim and audio mux.
// Copyright (c) 2025 ClipForge

#include "clipforge/media/Transcoder.hpp"

#include <cstdio>
#include <iterator>

#include "clipforge/util/Logger.hpp"

namespace clipforge::media {

namespace {

std::string DescribeFailure(const std::string& command, const util::ProcessResult& result) {
  if (!result.stderr_text.empty()) return result.stderr_text;
  if (!result.launched) return "Could not launch: " + command;
  if (result.term_signal != 0) {
    return "Killed by signal " + std::to_string(result.term_signal) + ": " + command;
  }
  return "Exited with status " + std::to_string(result.exit_code) + ": " + command;
}

}  // namespace

ToolError::ToolError(const std::string& command, const util::ProcessResult& result)
    : std::runtime_error(DescribeFailure(command, result)),
      command_(command),
      exit_code_(result.exit_code),
      term_signal_(result.term_signal),
      stderr_text_(result.stderr_text) {}

std::string FormatSeconds(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.6f", value);
  std::string s(buf);
  const auto dot = s.find('.');
  if (dot != std::string::npos) {
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
  }
  if (s == "-0") s = "0";
  return s;
}

std::vector<std::string> BuildTrimCommand(const std::string& ffmpeg_bin, const std::string& source,
                                          double start_s, double duration_s,
                                          const std::string& dest) {
  return {ffmpeg_bin, "-y",
          "-ss", FormatSeconds(start_s),
          "-t", FormatSeconds(duration_s),
          "-i", source,
          "-c", "copy",
          "-avoid_negative_ts", "make_zero",
          dest};
}

std::string BuildAudioFilter(const AudioMix& mix, double output_duration_s) {
  std::string filter;
  auto append = [&filter](const std::string& part) {
    if (!filter.empty()) filter += ",";
    filter += part;
  };
  if (mix.volume != 1.0) {
    append("volume=" + FormatSeconds(mix.volume));
  }
  if (mix.fade_in_s > 0.0) {
    append("afade=t=in:d=" + FormatSeconds(mix.fade_in_s));
  }
  if (mix.fade_out_s > 0.0) {
    const double fade_out_start = output_duration_s - mix.fade_out_s;
    if (fade_out_start > 0.0) {
      append("afade=t=out:st=" + FormatSeconds(fade_out_start) +
             ":d=" + FormatSeconds(mix.fade_out_s));
    }
  }
  return filter;
}

std::vector<std::string> BuildMuxCommand(const std::string& ffmpeg_bin, const std::string& video,
                                         const std::string& audio, const std::string& filter,
                                         const std::string& dest) {
  std::vector<std::string> argv = {ffmpeg_bin, "-y", "-i", video, "-i", audio, "-c:v", "copy"};
  if (!filter.empty()) {
    argv.push_back("-af");
    argv.push_back(filter);
  }
  const char* tail[] = {"-c:a", "aac", "-map", "0:v:0", "-map", "1:a:0", "-shortest"};
  argv.insert(argv.end(), std::begin(tail), std::end(tail));
  argv.push_back(dest);
  return argv;
}

FfmpegTranscoder::FfmpegTranscoder(const util::ProcessRunner& runner, std::string ffmpeg_bin)
    : runner_(runner), ffmpeg_bin_(std::move(ffmpeg_bin)) {}

void FfmpegTranscoder::Trim(const std::string& source, double start_s, double duration_s,
                            const std::string& dest) {
  RunOrThrow(BuildTrimCommand(ffmpeg_bin_, source, start_s, duration_s, dest));
}

void FfmpegTranscoder::MuxAudio(const std::string& video, const std::string& audio,
                                const AudioMix& mix, double output_duration_s,
                                const std::string& dest) {
  RunOrThrow(BuildMuxCommand(ffmpeg_bin_, video, audio, BuildAudioFilter(mix, output_duration_s),
                             dest));
}

void FfmpegTranscoder::RunOrThrow(const std::vector<std::string>& argv) {
  const std::string command = util::JoinCommand(argv);
  util::Logger::Debug("[Transcoder] Running: " + command);
  const util::ProcessResult result = runner_.Run(argv);
  if (!result.Succeeded()) {
    throw ToolError(command, result);
  }
}

}  // namespace clipforge::media
