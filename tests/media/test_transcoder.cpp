// Repository: ClipForge-render
// Component: Transcoder command construction unit tests

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "clipforge/media/Transcoder.hpp"
#include "clipforge/util/ProcessRunner.hpp"

namespace clipforge::media {
namespace {

using Argv = std::vector<std::string>;

class RecordingRunner : public util::ProcessRunner {
 public:
  util::ProcessResult Run(const std::vector<std::string>& argv) const override {
    calls.push_back(argv);
    util::ProcessResult r;
    r.launched = true;
    r.exit_code = exit_code;
    r.stderr_text = stderr_text;
    return r;
  }

  int exit_code = 0;
  std::string stderr_text;
  mutable std::vector<Argv> calls;
};

TEST(FormatSecondsTest, TrimsTrailingZeros) {
  EXPECT_EQ(FormatSeconds(7.5), "7.5");
  EXPECT_EQ(FormatSeconds(10.0), "10");
  EXPECT_EQ(FormatSeconds(0.125), "0.125");
  EXPECT_EQ(FormatSeconds(0.0), "0");
  EXPECT_EQ(FormatSeconds(1.0 / 3.0), "0.333333");
}

TEST(TranscoderCommandTest, TrimIsLosslessStreamCopy) {
  EXPECT_EQ(BuildTrimCommand("ffmpeg", "/styles/ocean.mp4", 12.25, 7.5,
                             "/out/trimmed_job.mp4"),
            (Argv{"ffmpeg", "-y", "-ss", "12.25", "-t", "7.5", "-i", "/styles/ocean.mp4", "-c",
                  "copy", "-avoid_negative_ts", "make_zero", "/out/trimmed_job.mp4"}));
}

TEST(TranscoderCommandTest, AudioFilterFullChain) {
  AudioMix mix;
  mix.volume = 0.8;
  mix.fade_in_s = 2.0;
  mix.fade_out_s = 3.0;
  EXPECT_EQ(BuildAudioFilter(mix, 15.0), "volume=0.8,afade=t=in:d=2,afade=t=out:st=12:d=3");
}

TEST(TranscoderCommandTest, AudioFilterOmitsNeutralParts) {
  AudioMix mix;
  EXPECT_EQ(BuildAudioFilter(mix, 15.0), "");

  mix.fade_out_s = 2.0;
  EXPECT_EQ(BuildAudioFilter(mix, 15.0), "afade=t=out:st=13:d=2");
  // A fade-out as long as the output would start at or before zero.
  EXPECT_EQ(BuildAudioFilter(mix, 2.0), "");
}

TEST(TranscoderCommandTest, MuxArgumentOrder) {
  EXPECT_EQ(BuildMuxCommand("ffmpeg", "temp.mp4", "song.mp3", "volume=0.5", "out.mp4"),
            (Argv{"ffmpeg", "-y", "-i", "temp.mp4", "-i", "song.mp3", "-c:v", "copy", "-af",
                  "volume=0.5", "-c:a", "aac", "-map", "0:v:0", "-map", "1:a:0", "-shortest",
                  "out.mp4"}));
  EXPECT_EQ(BuildMuxCommand("ffmpeg", "temp.mp4", "song.mp3", "", "out.mp4"),
            (Argv{"ffmpeg", "-y", "-i", "temp.mp4", "-i", "song.mp3", "-c:v", "copy", "-c:a",
                  "aac", "-map", "0:v:0", "-map", "1:a:0", "-shortest", "out.mp4"}));
}

TEST(FfmpegTranscoderTest, RunsConfiguredBinary) {
  RecordingRunner runner;
  FfmpegTranscoder transcoder(runner, "/opt/ffmpeg");
  transcoder.Trim("in.mp4", 1.0, 2.0, "out.mp4");
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].front(), "/opt/ffmpeg");
}

TEST(FfmpegTranscoderTest, FailureCarriesStderr) {
  RecordingRunner runner;
  runner.exit_code = 1;
  runner.stderr_text = "in.mp4: No such file or directory\n";
  FfmpegTranscoder transcoder(runner, "ffmpeg");

  try {
    transcoder.MuxAudio("in.mp4", "a.mp3", AudioMix{}, 10.0, "out.mp4");
    FAIL() << "expected ToolError";
  } catch (const ToolError& e) {
    EXPECT_EQ(std::string(e.what()), "in.mp4: No such file or directory\n");
    EXPECT_EQ(e.exit_code(), 1);
    EXPECT_NE(e.command().find("-shortest"), std::string::npos);
  }
}

}  // namespace
}  // namespace clipforge::media
