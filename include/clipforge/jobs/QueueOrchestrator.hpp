// Repository: ClipForge-render
// Component: Job Queue Orchestrator
// Purpose: Single-flight admission of queued jobs into isolated render processes.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_JOBS_QUEUE_ORCHESTRATOR_HPP_
#define CLIPFORGE_JOBS_QUEUE_ORCHESTRATOR_HPP_

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "clipforge/jobs/ActiveJobSet.hpp"
#include "clipforge/jobs/JobStore.hpp"
#include "clipforge/jobs/WorkerLauncher.hpp"

namespace clipforge::jobs {

struct OrchestratorConfig {
  std::chrono::milliseconds poll_interval{5000};

  // Output retention sweep; empty outputs_dir disables it.
  std::string outputs_dir;
  std::chrono::hours output_retention{24};
  std::chrono::minutes cleanup_interval{60};

  // Font download cache; stale `.lock` markers are removed at startup.
  std::string font_cache_dir;
};

enum class PollOutcome {
  kSkippedBusy,    // A render is active; nothing admitted
  kIdle,           // No in_queue job
  kLaunched,       // Oldest in_queue job handed to a new worker
  kLaunchFailed,   // Worker could not be spawned; job stays in_queue
};

const char* PollOutcomeToString(PollOutcome outcome);

// QueueOrchestrator is a thin scheduling loop:
//
//   Startup()  → reset the active set, fail jobs stranded in `rendering`,
//                drop font lock markers left by dead workers
//   PollOnce() → reap exited workers; if nothing is active, admit the oldest
//                in_queue job and spawn exactly one worker for it
//   Run()      → PollOnce() every poll_interval until |stop| is set
//
// At most one render runs at a time. There is no knob for more.
class QueueOrchestrator {
 public:
  QueueOrchestrator(JobStore& store,
                    ActiveJobSet& active_jobs,
                    WorkerLauncher& launcher,
                    OrchestratorConfig config);

  QueueOrchestrator(const QueueOrchestrator&) = delete;
  QueueOrchestrator& operator=(const QueueOrchestrator&) = delete;

  // Startup recovery sweep. Returns the number of stale jobs failed.
  int Startup();

  PollOutcome PollOnce();

  // Collects exited workers and frees their active-set slots.
  void ReapFinished();

  // Blocks until the running worker (if any) exits, then frees its slot.
  void WaitForWorkers();

  // Runs the retention sweep if cleanup_interval has elapsed since the last one.
  void MaybeCleanupOutputs(std::chrono::steady_clock::time_point now);

  // Poll loop. Sleeps in short slices so |stop| is honoured promptly.
  void Run(const std::atomic<bool>& stop);

 private:
  JobStore& store_;
  ActiveJobSet& active_jobs_;
  WorkerLauncher& launcher_;
  OrchestratorConfig config_;
  std::optional<std::chrono::steady_clock::time_point> last_cleanup_;
};

}  // namespace clipforge::jobs

#endif  // CLIPFORGE_JOBS_QUEUE_ORCHESTRATOR_HPP_
