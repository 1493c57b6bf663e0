// Repository: ClipForge-render
// Component: SourceSelector unit tests

#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

#include "clipforge/render/SourceSelector.hpp"
#include "fixtures/MediaStubs.h"
#include "fixtures/TempDirectory.h"

namespace clipforge::render {
namespace {

media::VideoInfo Info(double duration_s, double fps) {
  media::VideoInfo info;
  info.duration_s = duration_s;
  info.width = 1920;
  info.height = 1080;
  info.fps = fps;
  return info;
}

TEST(SourceSelectorTest, DurationMustStrictlyExceedRequirement) {
  EXPECT_TRUE(MeetsSelectionCriteria(Info(10.5, 30), 10.0, 1.0, 24));
  EXPECT_FALSE(MeetsSelectionCriteria(Info(10.0, 30), 10.0, 1.0, 24));
  EXPECT_FALSE(MeetsSelectionCriteria(Info(5.0, 30), 10.0, 1.0, 24));
}

TEST(SourceSelectorTest, SlowMotionFloorRejectsLowFrameRates) {
  // 30 fps at half speed plays back at an effective 15 fps.
  EXPECT_FALSE(MeetsSelectionCriteria(Info(60, 30), 10.0, 0.5, 24));
  EXPECT_TRUE(MeetsSelectionCriteria(Info(60, 48), 10.0, 0.5, 24));
  EXPECT_TRUE(MeetsSelectionCriteria(Info(60, 60), 10.0, 0.4, 24));
  // The floor only applies to slow motion.
  EXPECT_TRUE(MeetsSelectionCriteria(Info(60, 12), 10.0, 1.0, 24));
  EXPECT_TRUE(MeetsSelectionCriteria(Info(60, 12), 10.0, 2.0, 24));
}

TEST(SourceSelectorTest, ZeroFloorDisablesFrameRateCheck) {
  EXPECT_TRUE(MeetsSelectionCriteria(Info(60, 30), 10.0, 0.5, 0));
}

TEST(SourceSelectorTest, FilterCandidatesSkipsUnprobeableAndRejected) {
  testing::StubProber prober;
  prober.Set("a.mp4", Info(5, 30));
  prober.Set("b.mp4", Info(40, 30));
  prober.Set("c.mp4", Info(40, 60));

  const auto kept = FilterCandidates({"a.mp4", "b.mp4", "c.mp4", "missing.mp4"}, prober, 10.0,
                                     0.5, 24);
  ASSERT_EQ(kept.size(), 1u);
  EXPECT_EQ(kept[0].path, "c.mp4");
  EXPECT_DOUBLE_EQ(kept[0].info.fps, 60);
  EXPECT_EQ(prober.calls(), 4);
}

TEST(SourceSelectorTest, ValidIntervalsAvoidSkips) {
  const auto valid = BuildValidIntervals({{50, 60}, {10, 20}}, 100);
  ASSERT_EQ(valid.size(), 3u);
  EXPECT_DOUBLE_EQ(valid[0].start_s, 0);
  EXPECT_DOUBLE_EQ(valid[0].end_s, 10);
  EXPECT_DOUBLE_EQ(valid[1].start_s, 20);
  EXPECT_DOUBLE_EQ(valid[1].end_s, 50);
  EXPECT_DOUBLE_EQ(valid[2].start_s, 60);
  EXPECT_DOUBLE_EQ(valid[2].end_s, 100);
}

TEST(SourceSelectorTest, OverlappingSkipsMerge) {
  const auto valid = BuildValidIntervals({{10, 40}, {20, 30}, {35, 50}}, 100);
  ASSERT_EQ(valid.size(), 2u);
  EXPECT_DOUBLE_EQ(valid[0].end_s, 10);
  EXPECT_DOUBLE_EQ(valid[1].start_s, 50);
  EXPECT_DOUBLE_EQ(valid[1].end_s, 100);
}

TEST(SourceSelectorTest, NoSkipsOrFullCoverageYieldsWholeVideo) {
  auto valid = BuildValidIntervals({}, 30);
  ASSERT_EQ(valid.size(), 1u);
  EXPECT_DOUBLE_EQ(valid[0].start_s, 0);
  EXPECT_DOUBLE_EQ(valid[0].end_s, 30);

  valid = BuildValidIntervals({{0, 30}}, 30);
  ASSERT_EQ(valid.size(), 1u);
  EXPECT_DOUBLE_EQ(valid[0].end_s, 30);
}

TEST(SourceSelectorTest, StartRangesDropIntervalsTooShort) {
  const auto ranges = BuildStartRanges({{0, 10}, {20, 50}, {60, 100}}, 15);
  ASSERT_EQ(ranges.size(), 2u);
  EXPECT_DOUBLE_EQ(ranges[0].start_s, 20);
  EXPECT_DOUBLE_EQ(ranges[0].end_s, 35);
  EXPECT_DOUBLE_EQ(ranges[1].start_s, 60);
  EXPECT_DOUBLE_EQ(ranges[1].end_s, 85);
}

TEST(SourceSelectorTest, StartOffsetAlwaysLandsInsideAStartRange) {
  std::mt19937_64 rng(7);
  const std::vector<TimeRange> valid = {{0, 10}, {20, 50}, {60, 100}};
  for (int i = 0; i < 500; ++i) {
    const auto offset = ChooseStartOffset(valid, 15, rng);
    ASSERT_TRUE(offset.has_value());
    const bool in_first = *offset >= 20 && *offset <= 35;
    const bool in_second = *offset >= 60 && *offset <= 85;
    EXPECT_TRUE(in_first || in_second) << *offset;
  }
}

TEST(SourceSelectorTest, NoFittingSlotYieldsNullopt) {
  std::mt19937_64 rng(1);
  EXPECT_FALSE(ChooseStartOffset({{0, 10}, {20, 29}}, 10, rng).has_value());
}

TEST(SourceSelectorTest, ListStyleCandidates) {
  testing::TempDirectory dir("styles");
  testing::WriteTextFile(dir.File("ocean.mp4"), "x");
  testing::WriteTextFile(dir.File("city.mp4"), "x");
  testing::WriteTextFile(dir.File("notes.txt"), "x");
  dir.Subdir("nested.mp4");

  const auto all = ListStyleCandidates(dir.path().string(), "random");
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0], dir.File("city.mp4"));
  EXPECT_EQ(all[1], dir.File("ocean.mp4"));

  const auto named = ListStyleCandidates(dir.path().string(), "ocean");
  ASSERT_EQ(named.size(), 1u);
  EXPECT_EQ(named[0], dir.File("ocean.mp4"));

  EXPECT_TRUE(ListStyleCandidates(dir.path().string(), "desert").empty());
  EXPECT_TRUE(ListStyleCandidates(dir.File("absent"), "random").empty());
}

TEST(SourceSelectorTest, LoadSkipTableKeyedByStem) {
  testing::TempDirectory dir("skips");
  const std::string path = dir.File("style_skips.json");
  testing::WriteTextFile(path, R"({
    "ocean": [{"start": 5, "end": 12.5}, {"start": "bad", "end": 3}],
    "city": [],
    "broken": "nope"
  })");

  const SkipTable table = LoadSkipTable(path);
  ASSERT_EQ(table.count("ocean"), 1u);
  ASSERT_EQ(table.at("ocean").size(), 1u);
  EXPECT_DOUBLE_EQ(table.at("ocean")[0].start_s, 5);
  EXPECT_DOUBLE_EQ(table.at("ocean")[0].end_s, 12.5);
  EXPECT_TRUE(table.at("city").empty());
  EXPECT_EQ(table.count("broken"), 0u);
}

TEST(SourceSelectorTest, MissingOrMalformedSkipFileIsEmpty) {
  testing::TempDirectory dir("skips");
  EXPECT_TRUE(LoadSkipTable(dir.File("absent.json")).empty());
  testing::WriteTextFile(dir.File("bad.json"), "[1,2");
  EXPECT_TRUE(LoadSkipTable(dir.File("bad.json")).empty());
}

}  // namespace
}  // namespace clipforge::render
