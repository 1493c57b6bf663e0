// Repository: ClipForge-render
// Component: Worker Launcher
// Purpose: Spawns one isolated OS process per render and reports its exit.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_JOBS_WORKER_LAUNCHER_HPP_
#define CLIPFORGE_JOBS_WORKER_LAUNCHER_HPP_

#include <sys/types.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace clipforge::jobs {

struct WorkerExit {
  std::string job_id;
  int exit_code = -1;   // Valid when term_signal == 0
  int term_signal = 0;  // Non-zero when the worker was killed (crash, OOM kill)

  bool Clean() const { return term_signal == 0 && exit_code == 0; }
};

// WorkerLauncher abstracts "spawn an isolated unit of work, then observe its
// completion through its exit status". The orchestrator shares nothing with a
// worker except the job id and the handles the worker opens itself.
class WorkerLauncher {
 public:
  virtual ~WorkerLauncher() = default;

  // Starts a worker for |job_id|. Returns false if it could not be started.
  virtual bool Launch(const std::string& job_id) = 0;

  // Non-blocking: returns workers that have exited since the last call.
  virtual std::vector<WorkerExit> Reap() = 0;

  // Blocks until every running worker has exited and returns them.
  virtual std::vector<WorkerExit> WaitAll() = 0;

  virtual size_t Running() const = 0;
};

// Entry point executed inside the child. Its return value becomes the
// child's exit status. It must open its own database connections.
using WorkerEntry = std::function<int(const std::string& job_id)>;

// fork()-based launcher. The child runs |entry| and leaves via _exit(), so
// no parent-owned destructors (sqlite handles, loggers) run in the child.
class ForkWorkerLauncher : public WorkerLauncher {
 public:
  explicit ForkWorkerLauncher(WorkerEntry entry);
  ~ForkWorkerLauncher() override;

  ForkWorkerLauncher(const ForkWorkerLauncher&) = delete;
  ForkWorkerLauncher& operator=(const ForkWorkerLauncher&) = delete;

  bool Launch(const std::string& job_id) override;
  std::vector<WorkerExit> Reap() override;
  std::vector<WorkerExit> WaitAll() override;
  size_t Running() const override { return children_.size(); }

 private:
  std::vector<WorkerExit> Collect(bool block);

  WorkerEntry entry_;
  std::map<pid_t, std::string> children_;
};

}  // namespace clipforge::jobs

#endif  // CLIPFORGE_JOBS_WORKER_LAUNCHER_HPP_
