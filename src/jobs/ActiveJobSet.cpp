// Repository: ClipForge-render
// Component: Active Job Set
// Purpose: Cross-process set of job ids with a live render worker.
// Copyright (c) 2025 ClipForge

#include "clipforge/jobs/ActiveJobSet.hpp"

namespace clipforge::jobs {

SqliteActiveJobSet::SqliteActiveJobSet(const std::string& database_path)
    : db_(database_path) {
  db_.Exec(
      "CREATE TABLE IF NOT EXISTS active_jobs ("
      "  job_id TEXT PRIMARY KEY,"
      "  added_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f','now'))"
      ");");
}

bool SqliteActiveJobSet::Insert(const std::string& job_id) {
  auto stmt = db_.Prepare("INSERT OR IGNORE INTO active_jobs (job_id) VALUES (?);");
  stmt.Bind(1, job_id);
  stmt.Step();
  return db_.Changes() == 1;
}

bool SqliteActiveJobSet::Remove(const std::string& job_id) {
  auto stmt = db_.Prepare("DELETE FROM active_jobs WHERE job_id = ?;");
  stmt.Bind(1, job_id);
  stmt.Step();
  return db_.Changes() == 1;
}

bool SqliteActiveJobSet::Contains(const std::string& job_id) {
  auto stmt = db_.Prepare("SELECT 1 FROM active_jobs WHERE job_id = ?;");
  stmt.Bind(1, job_id);
  return stmt.Step();
}

size_t SqliteActiveJobSet::Size() {
  auto stmt = db_.Prepare("SELECT COUNT(*) FROM active_jobs;");
  stmt.Step();
  return static_cast<size_t>(stmt.ColumnInt(0));
}

std::vector<std::string> SqliteActiveJobSet::Snapshot() {
  auto stmt = db_.Prepare("SELECT job_id FROM active_jobs ORDER BY added_at ASC;");
  std::vector<std::string> ids;
  while (stmt.Step()) {
    ids.push_back(stmt.ColumnText(0));
  }
  return ids;
}

void SqliteActiveJobSet::Clear() {
  db_.Exec("DELETE FROM active_jobs;");
}

}  // namespace clipforge::jobs
