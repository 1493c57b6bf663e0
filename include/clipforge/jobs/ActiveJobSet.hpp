// Repository: ClipForge-render
// Component: Active Job Set
// Purpose: Cross-process set of job ids with a live render worker.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_JOBS_ACTIVE_JOB_SET_HPP_
#define CLIPFORGE_JOBS_ACTIVE_JOB_SET_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "clipforge/jobs/SqliteDatabase.hpp"

namespace clipforge::jobs {

// ActiveJobSet is the only state shared between the orchestrator and the
// worker processes it spawns. Insert/Remove are atomic and idempotent, so
// both the exiting worker and the reaping orchestrator may remove the same id.
class ActiveJobSet {
 public:
  virtual ~ActiveJobSet() = default;

  // Returns false if |job_id| was already present.
  virtual bool Insert(const std::string& job_id) = 0;

  // Returns false if |job_id| was not present.
  virtual bool Remove(const std::string& job_id) = 0;

  virtual bool Contains(const std::string& job_id) = 0;
  virtual size_t Size() = 0;
  virtual std::vector<std::string> Snapshot() = 0;
  virtual void Clear() = 0;
};

// Table-backed set living in the job database file. Every process opens its
// own connection to the same path.
class SqliteActiveJobSet : public ActiveJobSet {
 public:
  explicit SqliteActiveJobSet(const std::string& database_path);

  bool Insert(const std::string& job_id) override;
  bool Remove(const std::string& job_id) override;
  bool Contains(const std::string& job_id) override;
  size_t Size() override;
  std::vector<std::string> Snapshot() override;
  void Clear() override;

 private:
  SqliteDatabase db_;
};

}  // namespace clipforge::jobs

#endif  // CLIPFORGE_JOBS_ACTIVE_JOB_SET_HPP_
