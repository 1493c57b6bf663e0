// Repository: ClipForge-render
// Component: Job Record Store
// Purpose: Persistent job records: FIFO admission, status transitions, progress.
// Copyright (c) 2025 ClipForge

#include "clipforge/jobs/JobStore.hpp"

#include <algorithm>
#include <cmath>

#include "clipforge/util/Logger.hpp"

namespace clipforge::jobs {

namespace {

// Millisecond UTC timestamps so created_at orders jobs submitted in the
// same second; rowid breaks any remaining tie.
constexpr const char* kNow = "strftime('%Y-%m-%d %H:%M:%f','now')";

constexpr const char* kJobColumns =
    "job_id, status, progress, queue_position, request_data, output_filename, "
    "error_message, created_at, updated_at, start_time";

Job ReadJob(const SqliteStatement& stmt) {
  Job job;
  job.job_id = stmt.ColumnText(0);
  job.status = ParseJobStatus(stmt.ColumnText(1)).value_or(JobStatus::kFailed);
  job.progress = static_cast<int>(stmt.ColumnInt(2));
  job.queue_position = static_cast<int>(stmt.ColumnInt(3));
  job.request_data = stmt.ColumnText(4);
  job.output_filename = stmt.ColumnOptionalText(5);
  job.error_message = stmt.ColumnOptionalText(6);
  job.created_at = stmt.ColumnText(7);
  job.updated_at = stmt.ColumnText(8);
  job.start_time = stmt.ColumnOptionalText(9);
  return job;
}

}  // namespace

SqliteJobStore::SqliteJobStore(const std::string& database_path) : db_(database_path) {
  db_.Exec(
      "CREATE TABLE IF NOT EXISTS jobs ("
      "  job_id TEXT PRIMARY KEY,"
      "  status TEXT NOT NULL DEFAULT 'in_queue',"
      "  progress INTEGER NOT NULL DEFAULT 0,"
      "  queue_position INTEGER NOT NULL DEFAULT 0,"
      "  request_data TEXT,"
      "  output_filename TEXT,"
      "  error_message TEXT,"
      "  created_at TEXT NOT NULL,"
      "  updated_at TEXT NOT NULL,"
      "  start_time TEXT"
      ");");
  db_.Exec("CREATE INDEX IF NOT EXISTS ix_jobs_status_created ON jobs(status, created_at);");
}

bool SqliteJobStore::Insert(const std::string& job_id, const std::string& request_data) {
  auto stmt = db_.Prepare(
      std::string("INSERT OR IGNORE INTO jobs (job_id, status, progress, request_data, "
                  "created_at, updated_at) VALUES (?, 'in_queue', 0, ?, ") +
      kNow + ", " + kNow + ");");
  stmt.Bind(1, job_id).Bind(2, request_data);
  stmt.Step();
  return db_.Changes() == 1;
}

std::optional<Job> SqliteJobStore::Get(const std::string& job_id) {
  auto stmt = db_.Prepare(std::string("SELECT ") + kJobColumns +
                          " FROM jobs WHERE job_id = ?;");
  stmt.Bind(1, job_id);
  if (!stmt.Step()) return std::nullopt;
  return ReadJob(stmt);
}

std::optional<Job> SqliteJobStore::NextQueued() {
  auto stmt = db_.Prepare(std::string("SELECT ") + kJobColumns +
                          " FROM jobs WHERE status = 'in_queue'"
                          " ORDER BY created_at ASC, rowid ASC LIMIT 1;");
  if (!stmt.Step()) return std::nullopt;
  return ReadJob(stmt);
}

std::vector<Job> SqliteJobStore::ListByStatus(JobStatus status) {
  auto stmt = db_.Prepare(std::string("SELECT ") + kJobColumns +
                          " FROM jobs WHERE status = ? ORDER BY created_at ASC, rowid ASC;");
  stmt.Bind(1, std::string(JobStatusToString(status)));
  std::vector<Job> out;
  while (stmt.Step()) {
    out.push_back(ReadJob(stmt));
  }
  return out;
}

int SqliteJobStore::FailStaleRendering() {
  auto stmt = db_.Prepare(std::string("UPDATE jobs SET status = 'failed', updated_at = ") +
                          kNow + " WHERE status = 'rendering';");
  stmt.Step();
  return db_.Changes();
}

bool SqliteJobStore::MarkRendering(const std::string& job_id) {
  auto stmt = db_.Prepare(std::string("UPDATE jobs SET status = 'rendering', progress = 0, "
                                      "start_time = ") + kNow + ", updated_at = " + kNow +
                          " WHERE job_id = ? AND status IN ('in_queue', 'rendering');");
  stmt.Bind(1, job_id);
  stmt.Step();
  return db_.Changes() == 1;
}

void SqliteJobStore::UpdateProgress(const std::string& job_id, int progress) {
  progress = std::clamp(progress, 0, 100);
  auto stmt = db_.Prepare(std::string("UPDATE jobs SET progress = ?, updated_at = ") + kNow +
                          " WHERE job_id = ? AND status = 'rendering' AND progress < ?;");
  stmt.Bind(1, static_cast<int64_t>(progress)).Bind(2, job_id).Bind(3, static_cast<int64_t>(progress));
  stmt.Step();
}

void SqliteJobStore::MarkComplete(const std::string& job_id, const std::string& output_filename) {
  auto stmt = db_.Prepare(std::string("UPDATE jobs SET status = 'complete', progress = 100, "
                                      "output_filename = ?, error_message = NULL, updated_at = ") +
                          kNow + " WHERE job_id = ? AND status = 'rendering';");
  stmt.Bind(1, output_filename).Bind(2, job_id);
  stmt.Step();
  if (db_.Changes() != 1) {
    throw StoreError("Job " + job_id + " is not rendering; cannot mark complete");
  }
}

void SqliteJobStore::MarkFailed(const std::string& job_id, const std::string& error_message) {
  auto stmt = db_.Prepare(std::string("UPDATE jobs SET status = 'failed', output_filename = NULL, "
                                      "error_message = ?, updated_at = ") + kNow +
                          " WHERE job_id = ? AND status IN ('in_queue', 'rendering');");
  stmt.Bind(1, error_message).Bind(2, job_id);
  stmt.Step();
  if (db_.Changes() != 1) {
    util::Logger::Warn("[JobStore] MarkFailed ignored for job " + job_id +
                       " (missing or already terminal)");
  }
}

std::optional<JobStatusView> SqliteJobStore::Status(const std::string& job_id) {
  auto job = Get(job_id);
  if (!job) return std::nullopt;

  JobStatusView view;
  view.job_id = job->job_id;
  view.status = job->status;
  view.progress = job->progress;

  if (job->status == JobStatus::kInQueue) {
    auto stmt = db_.Prepare(
        "SELECT COUNT(*) FROM jobs WHERE status = 'in_queue' AND "
        "(created_at < ? OR (created_at = ? AND rowid < (SELECT rowid FROM jobs WHERE job_id = ?)));");
    stmt.Bind(1, job->created_at).Bind(2, job->created_at).Bind(3, job_id);
    stmt.Step();
    view.queue_position = static_cast<int>(stmt.ColumnInt(0)) + 1;
  }

  if (job->status == JobStatus::kRendering && job->progress > 0 && job->start_time) {
    auto stmt = db_.Prepare("SELECT (julianday('now') - julianday(?)) * 86400.0;");
    stmt.Bind(1, *job->start_time);
    stmt.Step();
    const double elapsed_s = stmt.ColumnDouble(0);
    if (elapsed_s > 0.0) {
      const double total_s = elapsed_s / (job->progress / 100.0);
      view.estimated_time_remaining_s =
          std::max(0, static_cast<int>(total_s - elapsed_s));
    }
  }

  if (job->status == JobStatus::kComplete) {
    view.filename = job->output_filename;
  }
  if (job->status == JobStatus::kFailed) {
    view.error_message = job->error_message;
  }
  return view;
}

}  // namespace clipforge::jobs
