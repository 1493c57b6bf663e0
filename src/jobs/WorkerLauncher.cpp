// Repository: ClipForge-render
// Component: Worker Launcher
// Purpose: Spawns one isolated OS process per render and reports its exit.
// Copyright (c) 2025 ClipForge

#include "clipforge/jobs/WorkerLauncher.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <iostream>

#include "clipforge/util/Logger.hpp"

namespace clipforge::jobs {

ForkWorkerLauncher::ForkWorkerLauncher(WorkerEntry entry) : entry_(std::move(entry)) {}

ForkWorkerLauncher::~ForkWorkerLauncher() {
  if (!children_.empty()) {
    util::Logger::Info("[WorkerLauncher] Waiting for " + std::to_string(children_.size()) +
                       " render worker(s) before shutdown");
    WaitAll();
  }
}

bool ForkWorkerLauncher::Launch(const std::string& job_id) {
  // Flush before fork so buffered parent output is not duplicated by the child.
  std::cout.flush();
  std::cerr.flush();
  std::fflush(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    util::Logger::Error("[WorkerLauncher] fork failed for job " + job_id + ": " +
                        std::strerror(errno));
    return false;
  }

  if (pid == 0) {
    int code = 1;
    try {
      code = entry_(job_id);
    } catch (const std::exception& e) {
      util::Logger::Error("[WorkerLauncher] Worker for job " + job_id +
                          " escaped with exception: " + e.what());
      code = 2;
    }
    std::cout.flush();
    std::cerr.flush();
    _exit(code);
  }

  children_[pid] = job_id;
  util::Logger::Info("[WorkerLauncher] Spawned render process pid=" + std::to_string(pid) +
                     " for job " + job_id);
  return true;
}

std::vector<WorkerExit> ForkWorkerLauncher::Reap() {
  return Collect(false);
}

std::vector<WorkerExit> ForkWorkerLauncher::WaitAll() {
  return Collect(true);
}

std::vector<WorkerExit> ForkWorkerLauncher::Collect(bool block) {
  std::vector<WorkerExit> exits;
  for (auto it = children_.begin(); it != children_.end();) {
    int status = 0;
    const pid_t r = waitpid(it->first, &status, block ? 0 : WNOHANG);
    if (r == 0) {
      ++it;
      continue;
    }
    if (r < 0) {
      if (errno == EINTR) continue;
      // ECHILD: already reaped elsewhere; report it as exited so the slot frees.
      util::Logger::Warn("[WorkerLauncher] waitpid(" + std::to_string(it->first) +
                         ") failed: " + std::strerror(errno));
      exits.push_back(WorkerExit{it->second, -1, 0});
      it = children_.erase(it);
      continue;
    }

    WorkerExit exit;
    exit.job_id = it->second;
    if (WIFEXITED(status)) {
      exit.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit.term_signal = WTERMSIG(status);
    }
    exits.push_back(exit);
    it = children_.erase(it);
  }
  return exits;
}

}  // namespace clipforge::jobs
