// Repository: ClipForge-render
// Component: Job Record
// Purpose: Job lifecycle states and the fields the render core reads/writes.
// Copyright (c) 2025 ClipForge

#include "clipforge/jobs/Job.hpp"

#include <nlohmann/json.hpp>

namespace clipforge::jobs {

const char* JobStatusToString(JobStatus status) {
  switch (status) {
    case JobStatus::kInQueue: return "in_queue";
    case JobStatus::kRendering: return "rendering";
    case JobStatus::kComplete: return "complete";
    case JobStatus::kFailed: return "failed";
  }
  return "failed";
}

std::optional<JobStatus> ParseJobStatus(const std::string& text) {
  if (text == "in_queue") return JobStatus::kInQueue;
  if (text == "rendering") return JobStatus::kRendering;
  if (text == "complete") return JobStatus::kComplete;
  if (text == "failed") return JobStatus::kFailed;
  return std::nullopt;
}

std::string JobStatusView::ToJson() const {
  nlohmann::json j;
  j["job_id"] = job_id;
  j["status"] = JobStatusToString(status);
  j["progress"] = progress;
  j["queue_position"] = queue_position ? nlohmann::json(*queue_position) : nlohmann::json();
  j["estimated_time_remaining_s"] = estimated_time_remaining_s
                                        ? nlohmann::json(*estimated_time_remaining_s)
                                        : nlohmann::json();
  if (filename) j["filename"] = *filename;
  if (error_message) j["error_message"] = *error_message;
  return j.dump();
}

}  // namespace clipforge::jobs
