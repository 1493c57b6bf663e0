// Repository: ClipForge-render
// Component: Media Stubs (test only)
// Purpose: In-memory frame sources/sinks, transcoder, prober and backend.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_TESTS_FIXTURES_MEDIA_STUBS_H_
#define CLIPFORGE_TESTS_FIXTURES_MEDIA_STUBS_H_

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "clipforge/media/Transcoder.hpp"
#include "clipforge/media/VideoProbe.hpp"
#include "clipforge/render/ColorParser.hpp"
#include "clipforge/render/FrameIO.hpp"
#include "clipforge/render/Image.hpp"
#include "clipforge/render/MediaBackend.hpp"

namespace clipforge::testing {

// Produces |frame_count| solid frames, then fails every read.
class SyntheticFrameSource : public render::FrameSource {
 public:
  SyntheticFrameSource(int64_t frame_count, int width, int height, render::Rgb color)
      : remaining_(frame_count), width_(width), height_(height), color_(color) {}

  bool ReadFrame(render::RgbFrame& out) override {
    if (remaining_ <= 0) return false;
    --remaining_;
    ++reads_;
    out = render::RgbFrame(width_, height_);
    for (size_t i = 0; i < out.data.size(); i += 3) {
      out.data[i] = color_.r;
      out.data[i + 1] = color_.g;
      out.data[i + 2] = color_.b;
    }
    return true;
  }

  int64_t reads() const { return reads_; }

 private:
  int64_t remaining_;
  int width_;
  int height_;
  render::Rgb color_;
  int64_t reads_ = 0;
};

// Keeps a probe pixel from every written frame instead of the frame itself.
class RecordingFrameSink : public render::FrameSink {
 public:
  RecordingFrameSink(int probe_x, int probe_y) : probe_x_(probe_x), probe_y_(probe_y) {}

  bool WriteFrame(const render::RgbFrame& frame) override {
    if (fail_after_ >= 0 && static_cast<int64_t>(probes_.size()) >= fail_after_) return false;
    const uint8_t* p = frame.Pixel(probe_x_, probe_y_);
    probes_.push_back(render::Rgb{p[0], p[1], p[2]});
    sizes_.push_back({frame.width, frame.height});
    return true;
  }

  void FailAfter(int64_t frames) { fail_after_ = frames; }

  const std::vector<render::Rgb>& probes() const { return probes_; }
  const std::vector<std::pair<int, int>>& sizes() const { return sizes_; }

 private:
  int probe_x_;
  int probe_y_;
  int64_t fail_after_ = -1;
  std::vector<render::Rgb> probes_;
  std::vector<std::pair<int, int>> sizes_;
};

// Serves fixed VideoInfo per path; unknown paths fail to probe.
class StubProber : public media::SourceProber {
 public:
  void Set(const std::string& path, const media::VideoInfo& info) { infos_[path] = info; }

  std::optional<media::VideoInfo> Probe(const std::string& path) override {
    ++calls_;
    const auto it = infos_.find(path);
    if (it == infos_.end()) return std::nullopt;
    return it->second;
  }

  int calls() const { return calls_; }

 private:
  std::map<std::string, media::VideoInfo> infos_;
  int calls_ = 0;
};

// Records invocations and materializes the destination files.
class StubTranscoder : public media::Transcoder {
 public:
  struct TrimCall {
    std::string source;
    double start_s;
    double duration_s;
    std::string dest;
  };
  struct MuxCall {
    std::string video;
    std::string audio;
    media::AudioMix mix;
    double output_duration_s;
    std::string dest;
  };

  void Trim(const std::string& source, double start_s, double duration_s,
            const std::string& dest) override {
    trims.push_back({source, start_s, duration_s, dest});
    if (trim_error) throw *trim_error;
    std::ofstream(dest) << "trimmed";
  }

  void MuxAudio(const std::string& video, const std::string& audio, const media::AudioMix& mix,
                double output_duration_s, const std::string& dest) override {
    muxes.push_back({video, audio, mix, output_duration_s, dest});
    if (mux_error) throw *mux_error;
    std::ofstream(dest) << "muxed";
  }

  std::vector<TrimCall> trims;
  std::vector<MuxCall> muxes;
  std::optional<media::ToolError> trim_error;
  std::optional<media::ToolError> mux_error;
};

// File-backed sink: counts frames and writes a placeholder file on finish.
class CountingFileSink : public render::FrameSink {
 public:
  explicit CountingFileSink(std::string path) : path_(std::move(path)) {}

  bool WriteFrame(const render::RgbFrame& frame) override {
    if (frame.width != render::kOutputWidth || frame.height != render::kOutputHeight) {
      return false;
    }
    ++frames_;
    return true;
  }

  bool Finish() {
    std::ofstream(path_) << "frames=" << frames_;
    return true;
  }

  int64_t frames() const { return frames_; }

 private:
  std::string path_;
  int64_t frames_ = 0;
};

// Decodes |source_frames| solid frames at |fps| for every opened path.
class StubMediaBackend : public render::MediaBackend {
 public:
  StubMediaBackend(int64_t source_frames, util::RationalFps fps)
      : source_frames_(source_frames), fps_(fps) {}

  std::unique_ptr<render::FrameSource> OpenSource(const std::string& path,
                                                  util::RationalFps& fps) override {
    opened_sources.push_back(path);
    fps = fps_;
    return std::make_unique<SyntheticFrameSource>(source_frames_, 90, 160,
                                                  render::Rgb{40, 80, 120});
  }

  std::unique_ptr<render::FrameSink> OpenSink(const std::string& path,
                                              const util::RationalFps& fps) override {
    opened_sinks.push_back(path);
    sink_fps = fps;
    return std::make_unique<CountingFileSink>(path);
  }

  bool FinishSink(render::FrameSink& sink) override {
    auto& counting = static_cast<CountingFileSink&>(sink);
    frames_finished = counting.frames();
    return counting.Finish();
  }

  std::vector<std::string> opened_sources;
  std::vector<std::string> opened_sinks;
  util::RationalFps sink_fps;
  int64_t frames_finished = -1;

 private:
  int64_t source_frames_;
  util::RationalFps fps_;
};

}  // namespace clipforge::testing

#endif  // CLIPFORGE_TESTS_FIXTURES_MEDIA_STUBS_H_
