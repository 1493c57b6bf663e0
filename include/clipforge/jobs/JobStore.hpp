// Repository: ClipForge-render
// Component: Job Record Store
// Purpose: Persistent job records: FIFO admission, status transitions, progress.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_JOBS_JOB_STORE_HPP_
#define CLIPFORGE_JOBS_JOB_STORE_HPP_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clipforge/jobs/Job.hpp"
#include "clipforge/jobs/SqliteDatabase.hpp"

namespace clipforge::jobs {

// JobStore is the single source of truth for job status.
//
// Writers:
// - The orchestrator: startup sweep (rendering → failed) only.
// - The render worker: its own job's status/progress/output fields.
// - The submitting layer: Insert().
//
// All methods throw StoreError on storage failure.
class JobStore {
 public:
  virtual ~JobStore() = default;

  // Creates an in_queue job. Returns false if |job_id| already exists.
  virtual bool Insert(const std::string& job_id, const std::string& request_data) = 0;

  virtual std::optional<Job> Get(const std::string& job_id) = 0;

  // Oldest in_queue job by created_at, ties broken by insertion order.
  virtual std::optional<Job> NextQueued() = 0;

  virtual std::vector<Job> ListByStatus(JobStatus status) = 0;

  // Transitions every rendering job to failed. Returns the number swept.
  virtual int FailStaleRendering() = 0;

  // in_queue/rendering → rendering with start_time = now and progress = 0.
  // Returns false if the job is missing or already terminal.
  virtual bool MarkRendering(const std::string& job_id) = 0;

  // Raises progress; lower values are ignored so progress never decreases.
  virtual void UpdateProgress(const std::string& job_id, int progress) = 0;

  virtual void MarkComplete(const std::string& job_id, const std::string& output_filename) = 0;

  virtual void MarkFailed(const std::string& job_id, const std::string& error_message) = 0;

  // Derived polling view (queue position / ETA). nullopt if unknown job.
  virtual std::optional<JobStatusView> Status(const std::string& job_id) = 0;
};

// SQLite-backed JobStore. The schema is created on construction.
class SqliteJobStore : public JobStore {
 public:
  explicit SqliteJobStore(const std::string& database_path);

  bool Insert(const std::string& job_id, const std::string& request_data) override;
  std::optional<Job> Get(const std::string& job_id) override;
  std::optional<Job> NextQueued() override;
  std::vector<Job> ListByStatus(JobStatus status) override;
  int FailStaleRendering() override;
  bool MarkRendering(const std::string& job_id) override;
  void UpdateProgress(const std::string& job_id, int progress) override;
  void MarkComplete(const std::string& job_id, const std::string& output_filename) override;
  void MarkFailed(const std::string& job_id, const std::string& error_message) override;
  std::optional<JobStatusView> Status(const std::string& job_id) override;

  SqliteDatabase& database() { return db_; }

 private:
  SqliteDatabase db_;
};

}  // namespace clipforge::jobs

#endif  // CLIPFORGE_JOBS_JOB_STORE_HPP_
