// Repository: ClipForge-render
// Component: Source Selector
// Purpose: Picks a source clip and a start offset that avoids skip intervals.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_SOURCE_SELECTOR_HPP_
#define CLIPFORGE_RENDER_SOURCE_SELECTOR_HPP_

#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "clipforge/media/VideoProbe.hpp"

namespace clipforge::render {

struct TimeRange {
  double start_s = 0.0;
  double end_s = 0.0;

  double Span() const { return end_s - start_s; }
};

// Clip stem → ranges that must not appear in output.
using SkipTable = std::map<std::string, std::vector<TimeRange>>;

// Reads style_skips.json ({"<stem>": [{"start": s, "end": e}, ...]}). A
// missing file is an empty table; a malformed one is logged and treated as
// empty.
SkipTable LoadSkipTable(const std::string& path);

struct SourceCandidate {
  std::string path;
  media::VideoInfo info;
};

// Every *.mp4 in |styles_dir| (sorted) for "random", otherwise
// <styles_dir>/<style>.mp4 when it exists.
std::vector<std::string> ListStyleCandidates(const std::string& styles_dir,
                                             const std::string& style);

// duration > required (strict); for speed < 1 the slowed output must keep
// fps * speed >= min_slowmo_fps (a floor of 0 disables the check).
bool MeetsSelectionCriteria(const media::VideoInfo& info, double required_duration_s,
                            double speed, double min_slowmo_fps);

// Probes each path and keeps the ones meeting the criteria.
std::vector<SourceCandidate> FilterCandidates(const std::vector<std::string>& paths,
                                              media::SourceProber& prober,
                                              double required_duration_s, double speed,
                                              double min_slowmo_fps);

// Gaps between |skips| inside [0, duration_s]. Falls back to the whole clip
// when the skips leave nothing.
std::vector<TimeRange> BuildValidIntervals(std::vector<TimeRange> skips, double duration_s);

// Ranges of admissible start offsets: [start, end - required] for every
// interval where that span is positive.
std::vector<TimeRange> BuildStartRanges(const std::vector<TimeRange>& valid_intervals,
                                        double required_duration_s);

// Uniform over the union of the start ranges (so each range is weighted by
// its span). nullopt when no range exists.
std::optional<double> ChooseStartOffset(const std::vector<TimeRange>& valid_intervals,
                                        double required_duration_s, std::mt19937_64& rng);

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_SOURCE_SELECTOR_HPP_
