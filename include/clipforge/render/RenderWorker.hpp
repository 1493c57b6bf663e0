// Repository: ClipForge-render
// Component: Render Worker
// Purpose: Executes one job end to end: select, trim, composite, mux, record.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_RENDER_WORKER_HPP_
#define CLIPFORGE_RENDER_RENDER_WORKER_HPP_

#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "clipforge/jobs/ActiveJobSet.hpp"
#include "clipforge/jobs/JobStore.hpp"
#include "clipforge/media/Transcoder.hpp"
#include "clipforge/media/VideoProbe.hpp"
#include "clipforge/render/FontResolver.hpp"
#include "clipforge/render/MediaBackend.hpp"
#include "clipforge/render/OverlayBaker.hpp"
#include "clipforge/render/RenderRequest.hpp"
#include "clipforge/render/SourceSelector.hpp"

namespace clipforge::render {

struct RenderWorkerConfig {
  std::string outputs_dir;
  std::string styles_dir;
  std::string audio_dir;
  std::string style_skips_file;
  double min_slowmo_fps = 24.0;
  OverlayBakerConfig baker;
};

// Every audio track under |audio_dir| (recursive, files with an extension),
// sorted by path.
std::vector<std::string> ListAudioTracks(const std::string& audio_dir);

// RenderWorker drives a single job through its lifecycle:
//
//   in_queue → rendering → complete | failed
//
// Run() never throws. Failures land in the job record as `failed` with an
// error_message (the stderr of a failed ffmpeg call when there is one). On
// every path the intermediate files are removed, the job id is released from
// the active set and |on_finish| is invoked.
class RenderWorker {
 public:
  RenderWorker(jobs::JobStore& store,
               jobs::ActiveJobSet& active_jobs,
               media::SourceProber& prober,
               media::Transcoder& transcoder,
               FontResolver& fonts,
               MediaBackend& media,
               RenderWorkerConfig config,
               uint64_t seed = std::random_device{}());

  RenderWorker(const RenderWorker&) = delete;
  RenderWorker& operator=(const RenderWorker&) = delete;

  // Returns true if the job reached `complete`.
  bool Run(const std::string& job_id, const std::function<void()>& on_finish = {});

  std::string TrimmedPath(const std::string& job_id) const;
  std::string TempOutputPath(const std::string& job_id) const;
  std::string OutputPath(const std::string& job_id) const;

 private:
  // Throws on any failure; Run() turns that into a failed record.
  void Render(const std::string& job_id, const RenderRequest& request);

  SourceCandidate PickSource(const RenderRequest& request, double required_s);
  double PickStartOffset(const SourceCandidate& source, double required_s);
  void FinishAudio(const std::string& job_id, const RenderRequest& request,
                   double duration_s);
  void RemoveIntermediates(const std::string& job_id, bool succeeded);

  jobs::JobStore& store_;
  jobs::ActiveJobSet& active_jobs_;
  media::SourceProber& prober_;
  media::Transcoder& transcoder_;
  FontResolver& fonts_;
  MediaBackend& media_;
  RenderWorkerConfig config_;
  std::mt19937_64 rng_;
};

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_RENDER_WORKER_HPP_
