// Repository: ClipForge-render
// Component: Render Worker
// Purpose: Executes one job end to end: select, trim, composite, mux, record.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/RenderWorker.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <utility>

#include "clipforge/render/FrameLoop.hpp"
#include "clipforge/render/RenderError.hpp"
#include "clipforge/render/SourceSelector.hpp"
#include "clipforge/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipforge::render {

namespace {

constexpr const char* kNoSourceMessage =
    "No suitable source videos found meeting duration and FPS criteria.";
constexpr const char* kNoSlotMessage =
    "No suitable time slot found in source video to fit the required duration.";
constexpr const char* kNoFramesMessage = "No frames were written.";

void RemoveIfExists(const std::string& path) {
  std::error_code ec;
  if (fs::remove(path, ec)) {
    util::Logger::Debug("[RenderWorker] Removed " + path);
  } else if (ec) {
    util::Logger::Warn("[RenderWorker] Could not remove " + path + ": " + ec.message());
  }
}

}  // namespace

std::vector<std::string> ListAudioTracks(const std::string& audio_dir) {
  std::vector<std::string> tracks;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(audio_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().has_extension()) {
      tracks.push_back(it->path().string());
    }
  }
  std::sort(tracks.begin(), tracks.end());
  return tracks;
}

RenderWorker::RenderWorker(jobs::JobStore& store,
                           jobs::ActiveJobSet& active_jobs,
                           media::SourceProber& prober,
                           media::Transcoder& transcoder,
                           FontResolver& fonts,
                           MediaBackend& media,
                           RenderWorkerConfig config,
                           uint64_t seed)
    : store_(store),
      active_jobs_(active_jobs),
      prober_(prober),
      transcoder_(transcoder),
      fonts_(fonts),
      media_(media),
      config_(std::move(config)),
      rng_(seed) {}

std::string RenderWorker::TrimmedPath(const std::string& job_id) const {
  return (fs::path(config_.outputs_dir) / ("trimmed_" + job_id + ".mp4")).string();
}

std::string RenderWorker::TempOutputPath(const std::string& job_id) const {
  return (fs::path(config_.outputs_dir) / ("temp_" + job_id + ".mp4")).string();
}

std::string RenderWorker::OutputPath(const std::string& job_id) const {
  return (fs::path(config_.outputs_dir) / (job_id + ".mp4")).string();
}

bool RenderWorker::Run(const std::string& job_id, const std::function<void()>& on_finish) {
  bool attempted = false;
  bool succeeded = false;
  util::Logger::Info("[RenderWorker] [" + job_id + "] Starting");

  try {
    if (!store_.MarkRendering(job_id)) {
      util::Logger::Error("[RenderWorker] [" + job_id +
                          "] Not found or already finished; not rendering");
    } else {
      attempted = true;
      try {
        const auto job = store_.Get(job_id);
        if (!job) throw RenderError("Job not found.");
        const RenderRequest request = ParseRenderRequest(job->request_data);
        Render(job_id, request);
        store_.MarkComplete(job_id, job_id + ".mp4");
        succeeded = true;
        util::Logger::Info("[RenderWorker] [" + job_id + "] Complete");
      } catch (const media::ToolError& e) {
        util::Logger::Error("[RenderWorker] [" + job_id + "] Failed: " + e.command() +
                            " exited with " + std::to_string(e.exit_code()));
        store_.MarkFailed(job_id, e.what());
      } catch (const std::exception& e) {
        util::Logger::Error("[RenderWorker] [" + job_id + "] Failed: " + e.what());
        store_.MarkFailed(job_id, e.what());
      }
    }
  } catch (const std::exception& e) {
    // The store itself failed; nothing more can be recorded for this job.
    util::Logger::Error("[RenderWorker] Could not record status for job " + job_id + ": " +
                        e.what());
  }

  if (attempted) RemoveIntermediates(job_id, succeeded);

  try {
    active_jobs_.Remove(job_id);
  } catch (const std::exception& e) {
    util::Logger::Error("[RenderWorker] Could not release active slot for " + job_id + ": " +
                        e.what());
  }

  if (on_finish) on_finish();
  return succeeded;
}

void RenderWorker::Render(const std::string& job_id, const RenderRequest& request) {
  const double required_s = request.RequiredSourceDurationSec();

  const SourceCandidate source = PickSource(request, required_s);
  const double start_s = PickStartOffset(source, required_s);
  util::Logger::Info("[RenderWorker] Using " + source.path + " from " +
                     std::to_string(start_s) + "s for " + std::to_string(required_s) + "s");

  const std::string trimmed = TrimmedPath(job_id);
  transcoder_.Trim(source.path, start_s, required_s, trimmed);

  OverlayBaker baker(fonts_, config_.baker);
  const std::vector<PrebakedOverlay> overlays = baker.Bake(request);
  util::Logger::Info("[RenderWorker] Pre-baked " + std::to_string(overlays.size()) +
                     " overlay(s)");

  util::RationalFps fps;
  auto frames_in = media_.OpenSource(trimmed, fps);
  if (!frames_in) throw RenderError("Could not open trimmed clip " + trimmed);
  if (!fps.IsValid()) {
    util::Logger::Warn("[RenderWorker] Trimmed clip reports no frame rate; assuming 30");
    fps = util::RationalFps{30, 1};
  }

  const std::string temp_output = TempOutputPath(job_id);
  auto frames_out = media_.OpenSink(temp_output, fps);
  if (!frames_out) throw RenderError("Could not open output " + temp_output);

  FrameLoopSettings settings;
  settings.speed = request.video.speed;
  settings.fps = fps.ToDouble();
  settings.total_frames = fps.FramesForDurationSec(request.video.duration_s);
  settings.duration_s = request.video.duration_s;
  settings.effects = ColorEffects::FromVideoSettings(request.video);
  settings.blur_kernel = BlurKernelSize(request.video.blur);
  settings.fade_in_s = request.video.fade_in_s;
  settings.fade_out_s = request.video.fade_out_s;

  const FrameLoopResult result = RunFrameLoop(
      *frames_in, *frames_out, overlays, settings,
      [this, &job_id](int progress) { store_.UpdateProgress(job_id, progress); });

  frames_in.reset();
  const bool finished = media_.FinishSink(*frames_out);
  frames_out.reset();

  util::Logger::Info("[RenderWorker] Wrote " + std::to_string(result.frames_written) + "/" +
                     std::to_string(settings.total_frames) + " frames (" +
                     std::to_string(result.repeated_frames) + " repeated)");
  if (result.frames_written == 0) throw RenderError(kNoFramesMessage);
  if (!finished) throw RenderError("Could not finalize output " + temp_output);

  FinishAudio(job_id, request, request.video.duration_s);
}

SourceCandidate RenderWorker::PickSource(const RenderRequest& request, double required_s) {
  const auto paths = ListStyleCandidates(config_.styles_dir, request.video.style);
  const auto candidates = FilterCandidates(paths, prober_, required_s, request.video.speed,
                                           config_.min_slowmo_fps);
  util::Logger::Info("[RenderWorker] " + std::to_string(candidates.size()) + " of " +
                     std::to_string(paths.size()) + " source(s) usable for style '" +
                     request.video.style + "'");
  if (candidates.empty()) throw RenderError(kNoSourceMessage);

  std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
  return candidates[pick(rng_)];
}

double RenderWorker::PickStartOffset(const SourceCandidate& source, double required_s) {
  const SkipTable skips = LoadSkipTable(config_.style_skips_file);
  std::vector<TimeRange> ranges;
  const auto it = skips.find(fs::path(source.path).stem().string());
  if (it != skips.end()) ranges = it->second;

  const auto valid = BuildValidIntervals(std::move(ranges), source.info.duration_s);
  const auto start = ChooseStartOffset(valid, required_s, rng_);
  if (!start) throw RenderError(kNoSlotMessage);
  return *start;
}

void RenderWorker::FinishAudio(const std::string& job_id, const RenderRequest& request,
                               double duration_s) {
  const std::string temp_output = TempOutputPath(job_id);
  const std::string output = OutputPath(job_id);

  std::vector<std::string> tracks;
  if (request.audio && request.audio->Enabled()) {
    tracks = ListAudioTracks(config_.audio_dir);
    if (tracks.empty()) {
      util::Logger::Warn("[RenderWorker] No audio tracks in " + config_.audio_dir +
                         "; writing silent output");
    }
  }

  if (!tracks.empty()) {
    std::uniform_int_distribution<size_t> pick(0, tracks.size() - 1);
    const std::string& track = tracks[pick(rng_)];
    media::AudioMix mix;
    mix.volume = request.audio->volume;
    mix.fade_in_s = request.audio->fade_in_s;
    mix.fade_out_s = request.audio->fade_out_s;
    util::Logger::Info("[RenderWorker] Muxing audio " + track);
    transcoder_.MuxAudio(temp_output, track, mix, duration_s, output);
    RemoveIfExists(temp_output);
    return;
  }

  std::error_code ec;
  fs::rename(temp_output, output, ec);
  if (ec) throw RenderError("Could not move " + temp_output + " to " + output + ": " + ec.message());
}

void RenderWorker::RemoveIntermediates(const std::string& job_id, bool succeeded) {
  RemoveIfExists(TrimmedPath(job_id));
  RemoveIfExists(TempOutputPath(job_id));
  if (!succeeded) RemoveIfExists(OutputPath(job_id));
}

}  // namespace clipforge::render
