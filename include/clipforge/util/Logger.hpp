// Repository: ClipForge-render
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by orchestrator and workers.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_UTIL_LOGGER_HPP_
#define CLIPFORGE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace clipforge::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

// Parses LOG_LEVEL style names (DEBUG, INFO, WARNING/WARN, ERROR).
// Unknown names map to kInfo.
LogLevel ParseLogLevel(const std::string& name);

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. Lines are prefixed with UTC time, level and pid so that the
// orchestrator and its forked render workers can share one log file.
//
// Info  → stdout (normal operational logs)
// Debug → stdout when the threshold is kDebug or CLIPFORGE_DEBUG is set
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (job failures, hard faults)
//
// Test-only: SetErrorSink/SetInfoSink install callbacks that receive the raw
// (unprefixed) line in addition to the normal output.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetLevel(LogLevel level);
  static LogLevel GetLevel();

  // Mirrors every emitted line into |path| (append mode). Empty path disables.
  // Returns false if the file cannot be opened.
  static bool SetLogFile(const std::string& path);

  // Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static LogLevel level_;
  static std::string log_file_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace clipforge::util

#endif  // CLIPFORGE_UTIL_LOGGER_HPP_
