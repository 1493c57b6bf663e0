// Repository: ClipForge-render
// Component: QueueOrchestrator unit tests

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "clipforge/jobs/ActiveJobSet.hpp"
#include "clipforge/jobs/JobStore.hpp"
#include "clipforge/jobs/QueueOrchestrator.hpp"
#include "clipforge/jobs/WorkerLauncher.hpp"
#include "fixtures/TempDirectory.h"

namespace clipforge::jobs {
namespace {

// Records launches; workers "exit" only when Finish() is called.
class StubLauncher : public WorkerLauncher {
 public:
  bool Launch(const std::string& job_id) override {
    launched.push_back(job_id);
    if (fail_launch) return false;
    running_.push_back(job_id);
    return true;
  }

  std::vector<WorkerExit> Reap() override {
    std::vector<WorkerExit> out;
    out.swap(finished_);
    return out;
  }

  std::vector<WorkerExit> WaitAll() override {
    std::vector<WorkerExit> out = Reap();
    for (const auto& id : running_) out.push_back(WorkerExit{id, 0, 0});
    running_.clear();
    return out;
  }

  size_t Running() const override { return running_.size(); }

  void Finish(const std::string& job_id, int exit_code = 0, int term_signal = 0) {
    for (auto it = running_.begin(); it != running_.end(); ++it) {
      if (*it == job_id) {
        running_.erase(it);
        finished_.push_back(WorkerExit{job_id, exit_code, term_signal});
        return;
      }
    }
  }

  std::vector<std::string> launched;
  bool fail_launch = false;

 private:
  std::vector<std::string> running_;
  std::vector<WorkerExit> finished_;
};

class QueueOrchestratorTest : public ::testing::Test {
 protected:
  QueueOrchestratorTest()
      : dir_("orchestrator"),
        store_(dir_.File("jobs.db")),
        active_(dir_.File("jobs.db")),
        orchestrator_(store_, active_, launcher_, OrchestratorConfig{}) {}

  testing::TempDirectory dir_;
  SqliteJobStore store_;
  SqliteActiveJobSet active_;
  StubLauncher launcher_;
  QueueOrchestrator orchestrator_;
};

TEST_F(QueueOrchestratorTest, IdleWhenQueueEmpty) {
  EXPECT_EQ(orchestrator_.PollOnce(), PollOutcome::kIdle);
  EXPECT_TRUE(launcher_.launched.empty());
}

TEST_F(QueueOrchestratorTest, LaunchesOldestQueuedJob) {
  ASSERT_TRUE(store_.Insert("first", "{}"));
  ASSERT_TRUE(store_.Insert("second", "{}"));

  EXPECT_EQ(orchestrator_.PollOnce(), PollOutcome::kLaunched);
  ASSERT_EQ(launcher_.launched.size(), 1u);
  EXPECT_EQ(launcher_.launched[0], "first");
  EXPECT_TRUE(active_.Contains("first"));
}

TEST_F(QueueOrchestratorTest, SingleFlightWhileWorkerActive) {
  ASSERT_TRUE(store_.Insert("first", "{}"));
  ASSERT_TRUE(store_.Insert("second", "{}"));

  ASSERT_EQ(orchestrator_.PollOnce(), PollOutcome::kLaunched);
  ASSERT_TRUE(store_.MarkRendering("first"));
  EXPECT_EQ(orchestrator_.PollOnce(), PollOutcome::kSkippedBusy);
  EXPECT_EQ(orchestrator_.PollOnce(), PollOutcome::kSkippedBusy);
  EXPECT_EQ(launcher_.launched.size(), 1u);

  store_.MarkComplete("first", "first.mp4");
  launcher_.Finish("first");
  EXPECT_EQ(orchestrator_.PollOnce(), PollOutcome::kLaunched);
  ASSERT_EQ(launcher_.launched.size(), 2u);
  EXPECT_EQ(launcher_.launched[1], "second");
  EXPECT_FALSE(active_.Contains("first"));
}

TEST_F(QueueOrchestratorTest, CrashedWorkerFreesSlot) {
  ASSERT_TRUE(store_.Insert("crashy", "{}"));
  ASSERT_EQ(orchestrator_.PollOnce(), PollOutcome::kLaunched);
  ASSERT_TRUE(store_.MarkRendering("crashy"));

  launcher_.Finish("crashy", 0, 9);
  orchestrator_.ReapFinished();
  EXPECT_EQ(active_.Size(), 0u);
  // The record stays rendering until the next startup sweep.
  EXPECT_EQ(store_.Get("crashy")->status, JobStatus::kRendering);
}

TEST_F(QueueOrchestratorTest, LaunchFailureLeavesJobQueued) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  launcher_.fail_launch = true;

  EXPECT_EQ(orchestrator_.PollOnce(), PollOutcome::kLaunchFailed);
  EXPECT_EQ(store_.Get("job-1")->status, JobStatus::kInQueue);
  EXPECT_EQ(active_.Size(), 0u);
}

TEST_F(QueueOrchestratorTest, RestartSweepsStrandedJobsThenResumesQueue) {
  // State left behind by a killed orchestrator: one job mid-render, its id
  // still in the active set, and more work queued behind it.
  ASSERT_TRUE(store_.Insert("stranded", "{}"));
  ASSERT_TRUE(store_.Insert("next", "{}"));
  ASSERT_TRUE(store_.MarkRendering("stranded"));
  store_.UpdateProgress("stranded", 40);
  ASSERT_TRUE(active_.Insert("stranded"));

  EXPECT_EQ(orchestrator_.Startup(), 1);
  EXPECT_EQ(store_.Get("stranded")->status, JobStatus::kFailed);
  EXPECT_EQ(active_.Size(), 0u);

  EXPECT_EQ(orchestrator_.PollOnce(), PollOutcome::kLaunched);
  ASSERT_EQ(launcher_.launched.size(), 1u);
  EXPECT_EQ(launcher_.launched[0], "next");
}

TEST_F(QueueOrchestratorTest, StartupClearsFontLocksLeftByDeadWorker) {
  const std::string cache = dir_.Subdir("fonts");
  testing::WriteTextFile(cache + "/Roboto.ttf.lock", "");
  testing::WriteTextFile(cache + "/Roboto.ttf", "font");

  OrchestratorConfig config;
  config.font_cache_dir = cache;
  QueueOrchestrator orchestrator(store_, active_, launcher_, config);
  EXPECT_EQ(orchestrator.Startup(), 0);

  EXPECT_FALSE(std::filesystem::exists(cache + "/Roboto.ttf.lock"));
  EXPECT_TRUE(std::filesystem::exists(cache + "/Roboto.ttf"));
}

TEST_F(QueueOrchestratorTest, WaitForWorkersReleasesSlots) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  ASSERT_EQ(orchestrator_.PollOnce(), PollOutcome::kLaunched);
  orchestrator_.WaitForWorkers();
  EXPECT_EQ(active_.Size(), 0u);
  EXPECT_EQ(launcher_.Running(), 0u);
}

TEST_F(QueueOrchestratorTest, RunHonoursStopFlag) {
  OrchestratorConfig config;
  config.poll_interval = std::chrono::milliseconds(50);
  QueueOrchestrator fast(store_, active_, launcher_, config);
  ASSERT_TRUE(store_.Insert("job-1", "{}"));

  SqliteActiveJobSet observer(dir_.File("jobs.db"));
  std::atomic<bool> stop{false};
  std::thread loop([&fast, &stop] { fast.Run(stop); });
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!observer.Contains("job-1") && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  stop.store(true);
  loop.join();

  ASSERT_EQ(launcher_.launched.size(), 1u);
  EXPECT_EQ(launcher_.launched[0], "job-1");
}

TEST(ForkWorkerLauncherTest, ReportsChildExitCode) {
  ForkWorkerLauncher launcher([](const std::string& job_id) { return job_id == "ok" ? 0 : 7; });
  ASSERT_TRUE(launcher.Launch("ok"));
  ASSERT_TRUE(launcher.Launch("bad"));
  EXPECT_EQ(launcher.Running(), 2u);

  auto exits = launcher.WaitAll();
  ASSERT_EQ(exits.size(), 2u);
  for (const auto& exit : exits) {
    if (exit.job_id == "ok") {
      EXPECT_TRUE(exit.Clean());
    } else {
      EXPECT_EQ(exit.exit_code, 7);
    }
  }
  EXPECT_EQ(launcher.Running(), 0u);
}

}  // namespace
}  // namespace clipforge::jobs
