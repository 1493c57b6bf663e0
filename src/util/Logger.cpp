// Repository: ClipForge-render
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by orchestrator and workers.
// Copyright (c) 2025 ClipForge

#include "clipforge/util/Logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace clipforge::util {

std::mutex Logger::mutex_;
LogLevel Logger::level_ = LogLevel::kInfo;
std::string Logger::log_file_;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::info_sink_;

namespace {

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo: return "INFO";
    case LogLevel::kWarn: return "WARNING";
    case LogLevel::kError: return "ERROR";
  }
  return "INFO";
}

std::string FormatPrefix(LogLevel level) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
  std::tm tm_utc{};
  gmtime_r(&secs, &tm_utc);

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S") << ","
      << std::setw(3) << std::setfill('0') << millis
      << " - " << LevelName(level) << " - P" << getpid() << " - ";
  return oss.str();
}

}  // namespace

LogLevel ParseLogLevel(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "DEBUG") return LogLevel::kDebug;
  if (upper == "WARNING" || upper == "WARN") return LogLevel::kWarn;
  if (upper == "ERROR" || upper == "CRITICAL") return LogLevel::kError;
  return LogLevel::kInfo;
}

void Logger::SetLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::GetLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool Logger::SetLogFile(const std::string& path) {
  if (!path.empty()) {
    std::ofstream probe(path, std::ios::app);
    if (!probe) return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  log_file_ = path;
  return true;
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::Emit(LogLevel level, const std::string& line) {
  // Caller holds mutex_.
  const std::string full = FormatPrefix(level) + line;
  std::ostream& out = (level >= LogLevel::kWarn) ? std::cerr : std::cout;
  out << full << '\n';
  out.flush();

  if (!log_file_.empty()) {
    // Reopened per line: forked workers append to the same file without
    // sharing a stream buffer with the parent.
    std::ofstream file(log_file_, std::ios::app);
    if (file) {
      file << full << '\n';
    }
  }
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  if (level_ > LogLevel::kInfo) return;
  Emit(LogLevel::kInfo, line);
}

void Logger::Debug(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level_ > LogLevel::kDebug && std::getenv("CLIPFORGE_DEBUG") == nullptr) return;
  Emit(LogLevel::kDebug, line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level_ > LogLevel::kWarn) return;
  Emit(LogLevel::kWarn, line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  Emit(LogLevel::kError, line);
}

}  // namespace clipforge::util
