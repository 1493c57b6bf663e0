// Repository: ClipForge-render
// Component: Job Queue Orchestrator
// Purpose: Single-flight admission of queued jobs into isolated render processes.
// Copyright (c) 2025 ClipForge

#include "clipforge/jobs/QueueOrchestrator.hpp"

#include <exception>
#include <thread>

#include "clipforge/jobs/OutputCleanup.hpp"
#include "clipforge/util/Logger.hpp"

namespace clipforge::jobs {

namespace {
constexpr auto kSleepSlice = std::chrono::milliseconds(100);
}  // namespace

const char* PollOutcomeToString(PollOutcome outcome) {
  switch (outcome) {
    case PollOutcome::kSkippedBusy: return "skipped_busy";
    case PollOutcome::kIdle: return "idle";
    case PollOutcome::kLaunched: return "launched";
    case PollOutcome::kLaunchFailed: return "launch_failed";
  }
  return "unknown";
}

QueueOrchestrator::QueueOrchestrator(JobStore& store,
                                     ActiveJobSet& active_jobs,
                                     WorkerLauncher& launcher,
                                     OrchestratorConfig config)
    : store_(store),
      active_jobs_(active_jobs),
      launcher_(launcher),
      config_(std::move(config)) {}

int QueueOrchestrator::Startup() {
  // No worker can outlive the orchestrator that spawned it from our point of
  // view: whatever the set holds is left over from a previous run.
  const size_t leftover = active_jobs_.Size();
  if (leftover > 0) {
    util::Logger::Warn("[Orchestrator] Clearing " + std::to_string(leftover) +
                       " stale active-job entries");
  }
  active_jobs_.Clear();
  RemoveStaleFontLocks(config_.font_cache_dir);

  const int swept = store_.FailStaleRendering();
  if (swept > 0) {
    util::Logger::Warn("[Orchestrator] Found " + std::to_string(swept) +
                       " stale jobs. Marked as failed.");
  } else {
    util::Logger::Info("[Orchestrator] No stale jobs found.");
  }
  return swept;
}

void QueueOrchestrator::ReapFinished() {
  for (const WorkerExit& exit : launcher_.Reap()) {
    if (exit.term_signal != 0) {
      util::Logger::Error("[Orchestrator] Render process for job " + exit.job_id +
                          " killed by signal " + std::to_string(exit.term_signal));
    } else if (exit.exit_code != 0) {
      util::Logger::Warn("[Orchestrator] Render process for job " + exit.job_id +
                         " exited with code " + std::to_string(exit.exit_code));
    } else {
      util::Logger::Info("[Orchestrator] Render process for job " + exit.job_id + " has finished.");
    }
    active_jobs_.Remove(exit.job_id);
  }
}

void QueueOrchestrator::WaitForWorkers() {
  for (const WorkerExit& exit : launcher_.WaitAll()) {
    util::Logger::Info("[Orchestrator] Render process for job " + exit.job_id +
                       " exited (code=" + std::to_string(exit.exit_code) +
                       " signal=" + std::to_string(exit.term_signal) + ")");
    active_jobs_.Remove(exit.job_id);
  }
}

PollOutcome QueueOrchestrator::PollOnce() {
  ReapFinished();

  const size_t active = active_jobs_.Size();
  if (active > 0) {
    util::Logger::Debug("[Orchestrator] Queue check skipped: " + std::to_string(active) +
                        " job(s) already active.");
    return PollOutcome::kSkippedBusy;
  }

  std::optional<Job> next = store_.NextQueued();
  if (!next) {
    return PollOutcome::kIdle;
  }

  const std::string job_id = next->job_id;
  util::Logger::Info("[Orchestrator] Queue check: Found next job " + job_id +
                     ". Spawning render process.");
  active_jobs_.Insert(job_id);
  if (!launcher_.Launch(job_id)) {
    active_jobs_.Remove(job_id);
    util::Logger::Error("[Orchestrator] Could not spawn render process for job " + job_id +
                        "; it stays queued");
    return PollOutcome::kLaunchFailed;
  }
  return PollOutcome::kLaunched;
}

void QueueOrchestrator::MaybeCleanupOutputs(std::chrono::steady_clock::time_point now) {
  if (config_.outputs_dir.empty()) return;
  if (last_cleanup_ && now - *last_cleanup_ < config_.cleanup_interval) return;
  last_cleanup_ = now;
  CleanupOldOutputs(config_.outputs_dir, config_.output_retention);
}

void QueueOrchestrator::Run(const std::atomic<bool>& stop) {
  util::Logger::Info("[Orchestrator] Queue worker started (poll every " +
                     std::to_string(config_.poll_interval.count()) + " ms)");
  while (!stop.load(std::memory_order_acquire)) {
    try {
      PollOnce();
      MaybeCleanupOutputs(std::chrono::steady_clock::now());
    } catch (const std::exception& e) {
      util::Logger::Error(std::string("[Orchestrator] Error in queue loop: ") + e.what());
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.poll_interval;
    while (!stop.load(std::memory_order_acquire) &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(kSleepSlice);
    }
  }
  util::Logger::Info("[Orchestrator] Queue worker stopping");
}

}  // namespace clipforge::jobs
