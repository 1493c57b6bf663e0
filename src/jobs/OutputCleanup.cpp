// Repository: ClipForge-render
// Component: Output Retention
// Purpose: Deletes rendered outputs older than the retention window.
// Copyright (c) 2025 ClipForge

#include "clipforge/jobs/OutputCleanup.hpp"

#include <sys/stat.h>

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "clipforge/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipforge::jobs {

CleanupResult CleanupOldOutputs(const std::string& outputs_dir,
                                std::chrono::hours retention,
                                std::chrono::system_clock::time_point now) {
  CleanupResult result;
  std::error_code ec;
  if (!fs::is_directory(outputs_dir, ec)) {
    util::Logger::Warn("[OutputCleanup] Outputs directory does not exist: " + outputs_dir);
    return result;
  }

  const auto now_s = std::chrono::duration_cast<std::chrono::seconds>(
                         now.time_since_epoch()).count();
  const auto retention_s = std::chrono::duration_cast<std::chrono::seconds>(retention).count();

  util::Logger::Debug("[OutputCleanup] Scanning " + outputs_dir + " for files older than " +
                      std::to_string(retention.count()) + " hours");

  fs::directory_iterator it(outputs_dir, ec);
  if (ec) {
    util::Logger::Error("[OutputCleanup] Error scanning outputs directory: " + ec.message());
    result.errors++;
    return result;
  }

  for (const auto& entry : it) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) continue;

    struct stat st {};
    if (stat(entry.path().c_str(), &st) != 0) {
      util::Logger::Error("[OutputCleanup] Cannot stat " + entry.path().filename().string());
      result.errors++;
      continue;
    }

    const long long age_s = static_cast<long long>(now_s) - static_cast<long long>(st.st_mtime);
    if (age_s <= retention_s) continue;

    std::ostringstream age;
    age << std::fixed << std::setprecision(1) << (static_cast<double>(age_s) / 3600.0);
    util::Logger::Info("[OutputCleanup] Deleting old file: " + entry.path().filename().string() +
                       " (age: " + age.str() + " hours)");
    if (!fs::remove(entry.path(), entry_ec) || entry_ec) {
      util::Logger::Error("[OutputCleanup] Could not delete " + entry.path().filename().string() +
                          ": " + entry_ec.message());
      result.errors++;
      continue;
    }
    result.files_deleted++;
  }

  if (result.files_deleted > 0 || result.errors > 0) {
    util::Logger::Info("[OutputCleanup] Cleanup complete. Files deleted: " +
                       std::to_string(result.files_deleted) +
                       ", Errors: " + std::to_string(result.errors));
  }
  return result;
}

int RemoveStaleFontLocks(const std::string& font_cache_dir) {
  std::error_code ec;
  if (font_cache_dir.empty() || !fs::is_directory(font_cache_dir, ec)) return 0;

  fs::directory_iterator it(font_cache_dir, ec);
  if (ec) {
    util::Logger::Error("[OutputCleanup] Error scanning font cache: " + ec.message());
    return 0;
  }

  int removed = 0;
  for (const auto& entry : it) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) continue;
    if (entry.path().extension() != ".lock") continue;
    if (!fs::remove(entry.path(), entry_ec) || entry_ec) {
      util::Logger::Error("[OutputCleanup] Could not delete font lock " +
                          entry.path().filename().string() + ": " + entry_ec.message());
      continue;
    }
    util::Logger::Warn("[OutputCleanup] Removed stale font lock: " +
                       entry.path().filename().string());
    removed++;
  }
  return removed;
}

}  // namespace clipforge::jobs
