// Repository: ClipForge-render
// Component: JobStore unit tests

#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "clipforge/jobs/JobStore.hpp"
#include "fixtures/TempDirectory.h"

namespace clipforge::jobs {
namespace {

class JobStoreTest : public ::testing::Test {
 protected:
  JobStoreTest() : dir_("jobstore"), store_(dir_.File("jobs.db")) {}

  testing::TempDirectory dir_;
  SqliteJobStore store_;
};

TEST_F(JobStoreTest, InsertCreatesQueuedJob) {
  ASSERT_TRUE(store_.Insert("job-1", R"({"video":{"duration":10}})"));

  const auto job = store_.Get("job-1");
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, JobStatus::kInQueue);
  EXPECT_EQ(job->progress, 0);
  EXPECT_EQ(job->request_data, R"({"video":{"duration":10}})");
  EXPECT_FALSE(job->output_filename.has_value());
  EXPECT_FALSE(job->error_message.has_value());
  EXPECT_FALSE(job->start_time.has_value());
}

TEST_F(JobStoreTest, DuplicateInsertIsRejected) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  EXPECT_FALSE(store_.Insert("job-1", "{\"other\":1}"));
  EXPECT_EQ(store_.Get("job-1")->request_data, "{}");
}

TEST_F(JobStoreTest, NextQueuedIsFifoByCreation) {
  ASSERT_TRUE(store_.Insert("first", "{}"));
  ASSERT_TRUE(store_.Insert("second", "{}"));
  ASSERT_TRUE(store_.Insert("third", "{}"));

  EXPECT_EQ(store_.NextQueued()->job_id, "first");
  ASSERT_TRUE(store_.MarkRendering("first"));
  EXPECT_EQ(store_.NextQueued()->job_id, "second");
  store_.MarkFailed("second", "boom");
  EXPECT_EQ(store_.NextQueued()->job_id, "third");
}

TEST_F(JobStoreTest, NextQueuedEmpty) {
  EXPECT_FALSE(store_.NextQueued().has_value());
}

TEST_F(JobStoreTest, MarkRenderingSetsStartTimeAndResetsProgress) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  ASSERT_TRUE(store_.MarkRendering("job-1"));

  const auto job = store_.Get("job-1");
  EXPECT_EQ(job->status, JobStatus::kRendering);
  EXPECT_EQ(job->progress, 0);
  EXPECT_TRUE(job->start_time.has_value());
}

TEST_F(JobStoreTest, MarkRenderingRejectsMissingAndTerminalJobs) {
  EXPECT_FALSE(store_.MarkRendering("nope"));
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  ASSERT_TRUE(store_.MarkRendering("job-1"));
  store_.MarkComplete("job-1", "job-1.mp4");
  EXPECT_FALSE(store_.MarkRendering("job-1"));
}

TEST_F(JobStoreTest, ProgressNeverDecreases) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  ASSERT_TRUE(store_.MarkRendering("job-1"));

  store_.UpdateProgress("job-1", 30);
  store_.UpdateProgress("job-1", 12);
  EXPECT_EQ(store_.Get("job-1")->progress, 30);
  store_.UpdateProgress("job-1", 95);
  EXPECT_EQ(store_.Get("job-1")->progress, 95);
  store_.UpdateProgress("job-1", 250);
  EXPECT_EQ(store_.Get("job-1")->progress, 100);
}

TEST_F(JobStoreTest, ProgressIgnoredUnlessRendering) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  store_.UpdateProgress("job-1", 40);
  EXPECT_EQ(store_.Get("job-1")->progress, 0);
}

TEST_F(JobStoreTest, CompleteSetsFilenameAndFullProgress) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  ASSERT_TRUE(store_.MarkRendering("job-1"));
  store_.MarkComplete("job-1", "job-1.mp4");

  const auto job = store_.Get("job-1");
  EXPECT_EQ(job->status, JobStatus::kComplete);
  EXPECT_EQ(job->progress, 100);
  EXPECT_EQ(job->output_filename.value_or(""), "job-1.mp4");
  EXPECT_FALSE(job->error_message.has_value());
}

TEST_F(JobStoreTest, CompleteRequiresRendering) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  EXPECT_THROW(store_.MarkComplete("job-1", "job-1.mp4"), StoreError);
}

TEST_F(JobStoreTest, FailedKeepsMessageAndNoFilename) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  ASSERT_TRUE(store_.MarkRendering("job-1"));
  store_.MarkFailed("job-1", "ffmpeg: Invalid data found when processing input");

  const auto job = store_.Get("job-1");
  EXPECT_EQ(job->status, JobStatus::kFailed);
  EXPECT_EQ(job->error_message.value_or(""), "ffmpeg: Invalid data found when processing input");
  EXPECT_FALSE(job->output_filename.has_value());
}

TEST_F(JobStoreTest, FailedDoesNotOverwriteComplete) {
  ASSERT_TRUE(store_.Insert("job-1", "{}"));
  ASSERT_TRUE(store_.MarkRendering("job-1"));
  store_.MarkComplete("job-1", "job-1.mp4");
  store_.MarkFailed("job-1", "late failure");
  EXPECT_EQ(store_.Get("job-1")->status, JobStatus::kComplete);
}

TEST_F(JobStoreTest, FailStaleRenderingSweepsOnlyRendering) {
  ASSERT_TRUE(store_.Insert("queued", "{}"));
  ASSERT_TRUE(store_.Insert("stuck-a", "{}"));
  ASSERT_TRUE(store_.Insert("stuck-b", "{}"));
  ASSERT_TRUE(store_.Insert("done", "{}"));
  ASSERT_TRUE(store_.MarkRendering("stuck-a"));
  ASSERT_TRUE(store_.MarkRendering("stuck-b"));
  ASSERT_TRUE(store_.MarkRendering("done"));
  store_.MarkComplete("done", "done.mp4");

  EXPECT_EQ(store_.FailStaleRendering(), 2);
  EXPECT_EQ(store_.Get("stuck-a")->status, JobStatus::kFailed);
  EXPECT_EQ(store_.Get("stuck-b")->status, JobStatus::kFailed);
  EXPECT_EQ(store_.Get("queued")->status, JobStatus::kInQueue);
  EXPECT_EQ(store_.Get("done")->status, JobStatus::kComplete);
  EXPECT_EQ(store_.FailStaleRendering(), 0);
}

TEST_F(JobStoreTest, ListByStatusInCreationOrder) {
  ASSERT_TRUE(store_.Insert("a", "{}"));
  ASSERT_TRUE(store_.Insert("b", "{}"));
  ASSERT_TRUE(store_.Insert("c", "{}"));
  ASSERT_TRUE(store_.MarkRendering("b"));

  const auto queued = store_.ListByStatus(JobStatus::kInQueue);
  ASSERT_EQ(queued.size(), 2u);
  EXPECT_EQ(queued[0].job_id, "a");
  EXPECT_EQ(queued[1].job_id, "c");
}

TEST_F(JobStoreTest, StatusReportsQueuePosition) {
  ASSERT_TRUE(store_.Insert("a", "{}"));
  ASSERT_TRUE(store_.Insert("b", "{}"));
  ASSERT_TRUE(store_.Insert("c", "{}"));

  EXPECT_EQ(store_.Status("a")->queue_position.value_or(0), 1);
  EXPECT_EQ(store_.Status("c")->queue_position.value_or(0), 3);

  ASSERT_TRUE(store_.MarkRendering("a"));
  EXPECT_FALSE(store_.Status("a")->queue_position.has_value());
  EXPECT_EQ(store_.Status("c")->queue_position.value_or(0), 2);
  EXPECT_FALSE(store_.Status("missing").has_value());
}

TEST_F(JobStoreTest, StatusJsonForTerminalJobs) {
  ASSERT_TRUE(store_.Insert("ok", "{}"));
  ASSERT_TRUE(store_.Insert("bad", "{}"));
  ASSERT_TRUE(store_.MarkRendering("ok"));
  store_.MarkComplete("ok", "ok.mp4");
  ASSERT_TRUE(store_.MarkRendering("bad"));
  store_.MarkFailed("bad", "No frames were written.");

  const auto ok = nlohmann::json::parse(store_.Status("ok")->ToJson());
  EXPECT_EQ(ok["status"], "complete");
  EXPECT_EQ(ok["progress"], 100);
  EXPECT_EQ(ok["filename"], "ok.mp4");
  EXPECT_TRUE(ok["queue_position"].is_null());

  const auto bad = nlohmann::json::parse(store_.Status("bad")->ToJson());
  EXPECT_EQ(bad["status"], "failed");
  EXPECT_EQ(bad["error_message"], "No frames were written.");
  EXPECT_FALSE(bad.contains("filename"));
}

TEST_F(JobStoreTest, JobStatusNamesRoundTrip) {
  for (JobStatus s : {JobStatus::kInQueue, JobStatus::kRendering, JobStatus::kComplete,
                      JobStatus::kFailed}) {
    EXPECT_EQ(ParseJobStatus(JobStatusToString(s)), s);
  }
  EXPECT_EQ(std::string(JobStatusToString(JobStatus::kInQueue)), "in_queue");
  EXPECT_FALSE(ParseJobStatus("paused").has_value());
}

}  // namespace
}  // namespace clipforge::jobs
