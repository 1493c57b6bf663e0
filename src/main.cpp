// Repository: ClipForge-render
// Component: Render Daemon
// Purpose: Queue orchestrator process; forks one render worker per admitted job.
// Copyright (c) 2025 ClipForge
//
// MODES OF OPERATION:
// 1. Daemon:   clipforge_renderd [--env FILE]
// 2. One shot: clipforge_renderd --once
// 3. Submit:   clipforge_renderd --enqueue request.json
// 4. Query:    clipforge_renderd --status JOB_ID

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>

#include "clipforge/jobs/ActiveJobSet.hpp"
#include "clipforge/jobs/JobStore.hpp"
#include "clipforge/jobs/QueueOrchestrator.hpp"
#include "clipforge/jobs/WorkerLauncher.hpp"
#include "clipforge/media/Transcoder.hpp"
#include "clipforge/media/VideoProbe.hpp"
#include "clipforge/render/FontResolver.hpp"
#include "clipforge/render/MediaBackend.hpp"
#include "clipforge/render/RenderRequest.hpp"
#include "clipforge/render/RenderWorker.hpp"
#include "clipforge/util/Config.hpp"
#include "clipforge/util/Logger.hpp"
#include "clipforge/util/ProcessRunner.hpp"

namespace {

std::atomic<bool> g_stop_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_stop_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::optional<std::string> env_file;
  std::string enqueue_path;
  std::string status_job_id;
  bool once = false;
  bool help = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Polls the job store and renders one queued job at a time.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --env FILE           Seed configuration from a KEY=VALUE file\n"
            << "  --once               Startup sweep, one poll, wait for the worker, exit\n"
            << "  --enqueue PATH       Queue the request JSON in PATH and print the job id\n"
            << "  --status JOB_ID      Print the job's status as JSON\n"
            << "  --help               Show this help message\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
    } else if (arg == "--env" && i + 1 < argc) {
      args.env_file = argv[++i];
    } else if (arg == "--once") {
      args.once = true;
    } else if (arg == "--enqueue" && i + 1 < argc) {
      args.enqueue_path = argv[++i];
    } else if (arg == "--status" && i + 1 < argc) {
      args.status_job_id = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }
  return args;
}

std::string NewJobId() {
  std::random_device rd;
  std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
  std::ostringstream id;
  id << std::hex << std::setfill('0') << std::setw(16) << gen() << std::setw(16) << gen();
  return id.str();
}

// Runs inside the forked child. Everything is opened fresh so the child
// shares no sqlite handles with the parent.
int RunWorker(const clipforge::util::Config& config, const std::string& job_id) {
  using namespace clipforge;
  try {
    jobs::SqliteJobStore store(config.database_path);
    jobs::SqliteActiveJobSet active_jobs(config.database_path);
    util::ProcessRunner runner;
    media::CachedFfprobeProber prober(runner, config.ffprobe_bin, config.video_info_cache_file);
    media::FfmpegTranscoder transcoder(runner, config.ffmpeg_bin);
    render::CurlFontFetcher fetcher(runner, config.curl_bin);

    render::FontResolverOptions font_options;
    font_options.cache_dir = config.font_cache_dir;
    font_options.fonts_dir = config.fonts_dir;
    font_options.catalog_cache_file = config.font_catalog_cache_file;
    font_options.api_key = config.google_fonts_api_key;
    font_options.fallback_font = config.DefaultFontPath();
    render::FontResolver fonts(font_options, fetcher);

    render::FfmpegMediaBackend media;

    render::RenderWorkerConfig worker_config;
    worker_config.outputs_dir = config.outputs_dir;
    worker_config.styles_dir = config.styles_dir;
    worker_config.audio_dir = config.audio_dir;
    worker_config.style_skips_file = config.style_skips_file;
    worker_config.min_slowmo_fps = config.min_slowmo_fps;
    worker_config.baker.default_font_path = config.DefaultFontPath();
    worker_config.baker.logo_dir = config.logo_dir;
    worker_config.baker.signature_dir = config.signature_dir;

    render::RenderWorker worker(store, active_jobs, prober, transcoder, fonts, media,
                                worker_config);
    return worker.Run(job_id) ? 0 : 1;
  } catch (const std::exception& e) {
    util::Logger::Error("[RenderWorker] [" + job_id + "] Worker setup failed: " + e.what());
    return 2;
  }
}

int Enqueue(const clipforge::util::Config& config, const std::string& path) {
  using namespace clipforge;
  std::ifstream in(path);
  if (!in) {
    std::cerr << "Cannot read " << path << "\n";
    return 1;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string request_data = buffer.str();

  try {
    render::ParseRenderRequest(request_data);
  } catch (const render::RequestParseError& e) {
    std::cerr << "Invalid request: " << e.what() << "\n";
    return 1;
  }

  jobs::SqliteJobStore store(config.database_path);
  const std::string job_id = NewJobId();
  if (!store.Insert(job_id, request_data)) {
    std::cerr << "Job id collision, try again\n";
    return 1;
  }
  std::cout << job_id << "\n";
  return 0;
}

int PrintStatus(const clipforge::util::Config& config, const std::string& job_id) {
  clipforge::jobs::SqliteJobStore store(config.database_path);
  const auto view = store.Status(job_id);
  if (!view) {
    std::cerr << "Unknown job " << job_id << "\n";
    return 1;
  }
  std::cout << view->ToJson() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace clipforge;

  const CliArgs args = ParseArgs(argc, argv);
  if (!args.error.empty()) {
    std::cerr << args.error << "\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  util::Config config;
  try {
    config = util::Config::Load(args.env_file);
  } catch (const std::exception& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  }

  util::Logger::SetLevel(util::ParseLogLevel(config.log_level));
  if (!config.log_file.empty() && !util::Logger::SetLogFile(config.log_file)) {
    std::cerr << "Cannot open log file " << config.log_file << "\n";
  }
  if (!config.EnsureDirectories()) return 1;

  try {
    if (!args.enqueue_path.empty()) return Enqueue(config, args.enqueue_path);
    if (!args.status_job_id.empty()) return PrintStatus(config, args.status_job_id);

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    jobs::SqliteJobStore store(config.database_path);
    jobs::SqliteActiveJobSet active_jobs(config.database_path);
    jobs::ForkWorkerLauncher launcher(
        [&config](const std::string& job_id) { return RunWorker(config, job_id); });

    jobs::OrchestratorConfig orchestrator_config;
    orchestrator_config.poll_interval = std::chrono::seconds(config.queue_poll_interval_seconds);
    orchestrator_config.outputs_dir = config.outputs_dir;
    orchestrator_config.output_retention = std::chrono::hours(config.output_retention_hours);
    orchestrator_config.cleanup_interval = std::chrono::minutes(config.cleanup_interval_minutes);
    orchestrator_config.font_cache_dir = config.font_cache_dir;

    jobs::QueueOrchestrator orchestrator(store, active_jobs, launcher, orchestrator_config);
    orchestrator.Startup();

    if (args.once) {
      const auto outcome = orchestrator.PollOnce();
      util::Logger::Info(std::string("[Main] Poll outcome: ") + jobs::PollOutcomeToString(outcome));
      orchestrator.WaitForWorkers();
      return 0;
    }

    util::Logger::Info("[Main] Render daemon started; polling every " +
                       std::to_string(config.queue_poll_interval_seconds) + "s");
    orchestrator.Run(g_stop_requested);
    util::Logger::Info("[Main] Stop requested; waiting for the running worker");
    orchestrator.WaitForWorkers();
  } catch (const std::exception& e) {
    util::Logger::Error(std::string("[Main] Fatal: ") + e.what());
    return 1;
  }
  return 0;
}
