// Repository: ClipForge-render
// Component: Job Record
// Purpose: Job lifecycle states and the fields the render core reads/writes.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_JOBS_JOB_HPP_
#define CLIPFORGE_JOBS_JOB_HPP_

#include <optional>
#include <string>

namespace clipforge::jobs {

// in_queue → rendering → complete | failed. Terminal states never revert.
enum class JobStatus {
  kInQueue,
  kRendering,
  kComplete,
  kFailed,
};

const char* JobStatusToString(JobStatus status);

// Returns nullopt for unknown strings.
std::optional<JobStatus> ParseJobStatus(const std::string& text);

inline bool IsTerminal(JobStatus status) {
  return status == JobStatus::kComplete || status == JobStatus::kFailed;
}

struct Job {
  std::string job_id;
  JobStatus status = JobStatus::kInQueue;
  int progress = 0;
  int queue_position = 0;
  std::string request_data;
  std::optional<std::string> output_filename;  // Set iff status == kComplete
  std::optional<std::string> error_message;    // Set only on failure
  std::string created_at;
  std::string updated_at;
  std::optional<std::string> start_time;
};

// Polling-client view of a job (queue position and ETA are derived).
struct JobStatusView {
  std::string job_id;
  JobStatus status = JobStatus::kInQueue;
  int progress = 0;
  std::optional<int> queue_position;               // in_queue only, 1-based
  std::optional<int> estimated_time_remaining_s;   // rendering with progress > 0
  std::optional<std::string> filename;             // complete only
  std::optional<std::string> error_message;        // failed only

  std::string ToJson() const;
};

}  // namespace clipforge::jobs

#endif  // CLIPFORGE_JOBS_JOB_HPP_
