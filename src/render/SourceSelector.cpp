// Repository: ClipForge-render
// Component: Source Selector
// Purpose: Picks a source clip and a start offset that avoids skip intervals.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/SourceSelector.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "clipforge/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipforge::render {

SkipTable LoadSkipTable(const std::string& path) {
  SkipTable table;
  std::ifstream in(path);
  if (!in) return table;

  std::stringstream buffer;
  buffer << in.rdbuf();
  const nlohmann::json doc = nlohmann::json::parse(buffer.str(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    util::Logger::Warn("[SourceSelector] Ignoring malformed skip file " + path);
    return table;
  }

  for (const auto& [stem, ranges] : doc.items()) {
    if (!ranges.is_array()) continue;
    auto& out = table[stem];
    for (const auto& r : ranges) {
      if (!r.is_object()) continue;
      const auto start = r.find("start");
      const auto end = r.find("end");
      if (start == r.end() || end == r.end() || !start->is_number() || !end->is_number()) {
        continue;
      }
      out.push_back(TimeRange{start->get<double>(), end->get<double>()});
    }
  }
  return table;
}

std::vector<std::string> ListStyleCandidates(const std::string& styles_dir,
                                             const std::string& style) {
  std::vector<std::string> paths;
  std::error_code ec;
  if (style == "random") {
    for (fs::directory_iterator it(styles_dir, ec), end; !ec && it != end; it.increment(ec)) {
      if (it->is_regular_file(ec) && it->path().extension() == ".mp4") {
        paths.push_back(it->path().string());
      }
    }
    std::sort(paths.begin(), paths.end());
  } else {
    const fs::path named = fs::path(styles_dir) / (style + ".mp4");
    if (fs::is_regular_file(named, ec)) paths.push_back(named.string());
  }
  return paths;
}

bool MeetsSelectionCriteria(const media::VideoInfo& info, double required_duration_s,
                            double speed, double min_slowmo_fps) {
  if (!(info.duration_s > required_duration_s)) return false;
  if (speed < 1.0 && min_slowmo_fps > 0.0 && info.fps * speed < min_slowmo_fps) return false;
  return true;
}

std::vector<SourceCandidate> FilterCandidates(const std::vector<std::string>& paths,
                                              media::SourceProber& prober,
                                              double required_duration_s, double speed,
                                              double min_slowmo_fps) {
  std::vector<SourceCandidate> out;
  for (const auto& path : paths) {
    const std::optional<media::VideoInfo> info = prober.Probe(path);
    if (!info) continue;
    if (!MeetsSelectionCriteria(*info, required_duration_s, speed, min_slowmo_fps)) {
      util::Logger::Debug("[SourceSelector] Rejected " + path);
      continue;
    }
    out.push_back(SourceCandidate{path, *info});
  }
  return out;
}

std::vector<TimeRange> BuildValidIntervals(std::vector<TimeRange> skips, double duration_s) {
  std::sort(skips.begin(), skips.end(),
            [](const TimeRange& a, const TimeRange& b) { return a.start_s < b.start_s; });

  std::vector<TimeRange> valid;
  double last_end = 0.0;
  for (const auto& skip : skips) {
    if (skip.start_s > last_end) {
      valid.push_back(TimeRange{last_end, std::min(skip.start_s, duration_s)});
    }
    last_end = std::max(last_end, skip.end_s);
  }
  if (duration_s > last_end) {
    valid.push_back(TimeRange{last_end, duration_s});
  }
  valid.erase(std::remove_if(valid.begin(), valid.end(),
                             [](const TimeRange& r) { return r.Span() <= 0.0; }),
              valid.end());
  if (valid.empty()) {
    valid.push_back(TimeRange{0.0, duration_s});
  }
  return valid;
}

std::vector<TimeRange> BuildStartRanges(const std::vector<TimeRange>& valid_intervals,
                                        double required_duration_s) {
  std::vector<TimeRange> ranges;
  for (const auto& interval : valid_intervals) {
    const double max_start = interval.end_s - required_duration_s;
    if (max_start > interval.start_s) {
      ranges.push_back(TimeRange{interval.start_s, max_start});
    }
  }
  return ranges;
}

std::optional<double> ChooseStartOffset(const std::vector<TimeRange>& valid_intervals,
                                        double required_duration_s, std::mt19937_64& rng) {
  const std::vector<TimeRange> ranges = BuildStartRanges(valid_intervals, required_duration_s);
  if (ranges.empty()) return std::nullopt;

  double total = 0.0;
  for (const auto& r : ranges) total += r.Span();

  std::uniform_real_distribution<double> dist(0.0, total);
  double point = dist(rng);
  for (const auto& r : ranges) {
    if (point < r.Span()) return r.start_s + point;
    point -= r.Span();
  }
  // Floating-point remainder at the very top of the distribution.
  return ranges.back().end_s;
}

}  // namespace clipforge::render
