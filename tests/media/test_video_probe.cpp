// Repository: ClipForge-render
// Component: VideoProbe unit tests

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clipforge/media/VideoProbe.hpp"
#include "clipforge/util/ProcessRunner.hpp"
#include "fixtures/TempDirectory.h"

namespace clipforge::media {
namespace {

std::string Fixture(const std::string& name) {
  return testing::ReadTextFile(std::string(CLIPFORGE_TEST_FIXTURES_DIR) + "/" + name);
}

// Replays canned ffprobe output and counts invocations.
class ScriptedRunner : public util::ProcessRunner {
 public:
  util::ProcessResult Run(const std::vector<std::string>& argv) const override {
    calls.push_back(argv);
    util::ProcessResult r;
    r.launched = true;
    r.exit_code = exit_code;
    r.stdout_text = stdout_text;
    r.stderr_text = exit_code == 0 ? "" : "moov atom not found";
    return r;
  }

  std::string stdout_text;
  int exit_code = 0;
  mutable std::vector<std::vector<std::string>> calls;
};

TEST(ParseFrameRateTest, HandlesRationalAndPlainForms) {
  EXPECT_DOUBLE_EQ(ParseFrameRate("30/1"), 30.0);
  EXPECT_NEAR(ParseFrameRate("30000/1001"), 29.97, 0.001);
  EXPECT_DOUBLE_EQ(ParseFrameRate("25"), 25.0);
  EXPECT_DOUBLE_EQ(ParseFrameRate("0/0"), 0.0);
}

TEST(ParseFfprobeOutputTest, PicksFirstVideoStream) {
  const auto info = ParseFfprobeOutput(Fixture("ffprobe/landscape_30fps.json"));
  ASSERT_TRUE(info.has_value());
  EXPECT_NEAR(info->duration_s, 19.986633, 1e-6);
  EXPECT_EQ(info->width, 1920);
  EXPECT_EQ(info->height, 1080);
  EXPECT_NEAR(info->fps, 29.97, 0.001);
}

TEST(ParseFfprobeOutputTest, RejectsAudioOnlyAndGarbage) {
  EXPECT_FALSE(ParseFfprobeOutput(R"({"streams":[{"codec_type":"audio"}]})").has_value());
  EXPECT_FALSE(ParseFfprobeOutput("nope").has_value());
  EXPECT_FALSE(ParseFfprobeOutput("{}").has_value());
}

TEST(CachedFfprobeProberTest, ProbesOnceThenServesFromCache) {
  testing::TempDirectory dir("probe");
  ScriptedRunner runner;
  runner.stdout_text = Fixture("ffprobe/landscape_30fps.json");
  const std::string cache = dir.File("cache/video_info_cache.json");
  const std::string clip = dir.File("clip.mp4");

  CachedFfprobeProber prober(runner, "ffprobe", cache);
  const auto first = prober.Probe(clip);
  const auto second = prober.Probe(clip);

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, *second);
  EXPECT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].front(), "ffprobe");
  EXPECT_EQ(runner.calls[0].back(), clip);

  // A fresh prober (another worker process) reads the same cache file.
  ScriptedRunner other_runner;
  CachedFfprobeProber other(other_runner, "ffprobe", cache);
  const auto third = other.Probe(clip);
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(*third, *first);
  EXPECT_TRUE(other_runner.calls.empty());

  const auto doc = nlohmann::json::parse(testing::ReadTextFile(cache));
  ASSERT_TRUE(doc.contains(clip));
  EXPECT_EQ(doc[clip]["width"], 1920);
  EXPECT_TRUE(doc[clip].contains("duration"));
  EXPECT_TRUE(doc[clip].contains("fps"));
}

TEST(CachedFfprobeProberTest, FailuresAreNotCached) {
  testing::TempDirectory dir("probe");
  ScriptedRunner runner;
  runner.exit_code = 1;
  const std::string cache = dir.File("video_info_cache.json");

  CachedFfprobeProber prober(runner, "ffprobe", cache);
  EXPECT_FALSE(prober.Probe(dir.File("broken.mp4")).has_value());
  EXPECT_FALSE(prober.Probe(dir.File("broken.mp4")).has_value());
  EXPECT_EQ(runner.calls.size(), 2u);
  EXPECT_FALSE(std::filesystem::exists(cache));
}

TEST(CachedFfprobeProberTest, CorruptCacheStartsEmptyAndIsRewritten) {
  testing::TempDirectory dir("probe");
  const std::string cache = dir.File("video_info_cache.json");
  testing::WriteTextFile(cache, "{{{");
  ScriptedRunner runner;
  runner.stdout_text = Fixture("ffprobe/landscape_30fps.json");

  CachedFfprobeProber prober(runner, "ffprobe", cache);
  ASSERT_TRUE(prober.Probe(dir.File("clip.mp4")).has_value());
  EXPECT_NO_THROW(nlohmann::json::parse(testing::ReadTextFile(cache)));
}

TEST(CachedFfprobeProberTest, MergesEntriesWrittenByOthers) {
  testing::TempDirectory dir("probe");
  const std::string cache = dir.File("video_info_cache.json");
  ScriptedRunner runner;
  runner.stdout_text = Fixture("ffprobe/landscape_30fps.json");

  CachedFfprobeProber a(runner, "ffprobe", cache);
  CachedFfprobeProber b(runner, "ffprobe", cache);
  ASSERT_TRUE(a.Probe(dir.File("one.mp4")).has_value());
  ASSERT_TRUE(b.Probe(dir.File("two.mp4")).has_value());

  const auto doc = nlohmann::json::parse(testing::ReadTextFile(cache));
  EXPECT_EQ(doc.size(), 2u);
}

}  // namespace
}  // namespace clipforge::media
