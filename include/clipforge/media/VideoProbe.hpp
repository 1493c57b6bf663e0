// Repository: ClipForge-render
// Component: Source Video Probe
// Purpose: ffprobe-backed source metadata with a persistent per-path cache.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_MEDIA_VIDEO_PROBE_HPP_
#define CLIPFORGE_MEDIA_VIDEO_PROBE_HPP_

#include <map>
#include <optional>
#include <string>

#include "clipforge/util/ProcessRunner.hpp"

namespace clipforge::media {

struct VideoInfo {
  double duration_s = 0.0;
  int width = 0;
  int height = 0;
  double fps = 0.0;

  bool operator==(const VideoInfo& o) const {
    return duration_s == o.duration_s && width == o.width && height == o.height && fps == o.fps;
  }
};

// Metadata of a source clip. nullopt when the clip cannot be probed.
class SourceProber {
 public:
  virtual ~SourceProber() = default;
  virtual std::optional<VideoInfo> Probe(const std::string& path) = 0;
};

// Extracts the first video stream's duration, size and avg_frame_rate from
// `ffprobe -print_format json -show_format -show_streams` output.
std::optional<VideoInfo> ParseFfprobeOutput(const std::string& json_text);

// Parses "num/den" (or a plain number). Returns 0 for "0/0" or garbage.
double ParseFrameRate(const std::string& text);

// CachedFfprobeProber runs ffprobe once per absolute source path and keeps
// the result in a JSON file (path → info) with no expiry. Failed probes are
// not cached. A corrupt or missing cache file starts empty.
//
// Thread Safety: one instance per worker process; the cache file is re-read
// before every write so entries added by other workers are preserved.
class CachedFfprobeProber : public SourceProber {
 public:
  CachedFfprobeProber(const util::ProcessRunner& runner, std::string ffprobe_bin,
                      std::string cache_file);

  std::optional<VideoInfo> Probe(const std::string& path) override;

 private:
  std::map<std::string, VideoInfo> LoadCache() const;
  void StoreCache(const std::map<std::string, VideoInfo>& cache) const;

  const util::ProcessRunner& runner_;
  std::string ffprobe_bin_;
  std::string cache_file_;
};

}  // namespace clipforge::media

#endif  // CLIPFORGE_MEDIA_VIDEO_PROBE_HPP_
