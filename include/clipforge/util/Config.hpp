// Repository: ClipForge-render
// Component: Runtime Configuration
// Purpose: Environment/.env driven settings for the render daemon and workers.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_UTIL_CONFIG_HPP_
#define CLIPFORGE_UTIL_CONFIG_HPP_

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace clipforge::util {

// Config holds every path and policy knob the core reads.
//
// Resolution order for each key: process environment, then the optional
// .env file, then the default derived from CLIPFORGE_ROOT (or the current
// directory when unset).
struct Config {
  std::string root_dir;

  // Persistence
  std::string database_path;

  // Remote font catalog credential (empty = no remote lookups)
  std::string google_fonts_api_key;

  // Output retention
  int output_retention_hours = 24;
  int cleanup_interval_minutes = 60;

  // Scheduling / render policy
  int queue_poll_interval_seconds = 5;
  double min_slowmo_fps = 24.0;  // 0 disables the slow-motion frame-rate floor

  // Asset and working directories
  std::string styles_dir;
  std::string audio_dir;
  std::string fonts_dir;
  std::string font_cache_dir;
  std::string logo_dir;
  std::string signature_dir;
  std::string outputs_dir;
  std::string cache_dir;
  std::string logs_dir;

  // Derived files
  std::string font_catalog_cache_file;
  std::string video_info_cache_file;
  std::string style_skips_file;
  std::string log_file;
  std::string log_level = "INFO";

  // Default font used whenever family resolution falls back.
  std::string default_font_file = "arial.ttf";

  // External tools
  std::string ffmpeg_bin = "ffmpeg";
  std::string ffprobe_bin = "ffprobe";
  std::string curl_bin = "curl";

  // Builds a Config from the process environment, seeded by |env_file| when
  // given. Throws std::runtime_error if |env_file| is given but unreadable or
  // a numeric key does not parse.
  static Config Load(const std::optional<std::string>& env_file = std::nullopt);

  // Same as Load() but reads keys through |lookup| instead of getenv.
  // Used by tests.
  static Config FromLookup(
      const std::function<std::optional<std::string>(const std::string&)>& lookup);

  // Creates every configured directory (parents included).
  // Returns false and logs if any directory cannot be created.
  bool EnsureDirectories() const;

  // Absolute path of the default font inside fonts_dir.
  std::string DefaultFontPath() const;
};

// Parses KEY=VALUE lines; '#' starts a comment; surrounding quotes are stripped.
std::map<std::string, std::string> ParseEnvFile(const std::string& contents);

}  // namespace clipforge::util

#endif  // CLIPFORGE_UTIL_CONFIG_HPP_
