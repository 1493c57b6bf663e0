// Repository: ClipForge-render
// Component: Runtime Configuration
// Purpose: Environment/.env driven settings for the render daemon and workers.
// Copyright (c) 2025 ClipForge

#include "clipforge/util/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "clipforge/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipforge::util {

namespace {

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

int ParseIntKey(const std::string& key, const std::string& value) {
  try {
    size_t used = 0;
    const int parsed = std::stoi(value, &used);
    if (used != value.size()) throw std::invalid_argument(value);
    return parsed;
  } catch (const std::exception&) {
    throw std::runtime_error("Config: " + key + " must be an integer, got '" + value + "'");
  }
}

double ParseDoubleKey(const std::string& key, const std::string& value) {
  try {
    size_t used = 0;
    const double parsed = std::stod(value, &used);
    if (used != value.size()) throw std::invalid_argument(value);
    return parsed;
  } catch (const std::exception&) {
    throw std::runtime_error("Config: " + key + " must be a number, got '" + value + "'");
  }
}

}  // namespace

std::map<std::string, std::string> ParseEnvFile(const std::string& contents) {
  std::map<std::string, std::string> out;
  std::istringstream in(contents);
  std::string line;
  while (std::getline(in, line)) {
    line = Trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = Trim(line.substr(7));
    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = Trim(line.substr(0, eq));
    std::string value = Trim(line.substr(eq + 1));
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    } else {
      const auto hash = value.find(" #");
      if (hash != std::string::npos) value = Trim(value.substr(0, hash));
    }
    if (!key.empty()) out[key] = value;
  }
  return out;
}

Config Config::Load(const std::optional<std::string>& env_file) {
  std::map<std::string, std::string> file_values;
  if (env_file) {
    std::ifstream in(*env_file);
    if (!in) {
      throw std::runtime_error("Config: cannot read env file " + *env_file);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    file_values = ParseEnvFile(buffer.str());
  }

  return FromLookup([&file_values](const std::string& key) -> std::optional<std::string> {
    if (const char* v = std::getenv(key.c_str())) return std::string(v);
    auto it = file_values.find(key);
    if (it != file_values.end()) return it->second;
    return std::nullopt;
  });
}

Config Config::FromLookup(
    const std::function<std::optional<std::string>(const std::string&)>& lookup) {
  auto get = [&lookup](const std::string& key, const std::string& fallback) {
    auto v = lookup(key);
    return (v && !v->empty()) ? *v : fallback;
  };

  Config c;
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  const fs::path root = fs::path(get("CLIPFORGE_ROOT", ec ? "." : cwd.string()));
  c.root_dir = root.string();

  c.database_path = get("DATABASE_PATH", (root / "clipforge.db").string());
  c.google_fonts_api_key = get("GOOGLE_FONTS_API_KEY", "");

  if (auto v = lookup("OUTPUT_RETENTION_HOURS"); v && !v->empty()) {
    c.output_retention_hours = ParseIntKey("OUTPUT_RETENTION_HOURS", *v);
  }
  if (auto v = lookup("CLEANUP_INTERVAL_MINUTES"); v && !v->empty()) {
    c.cleanup_interval_minutes = ParseIntKey("CLEANUP_INTERVAL_MINUTES", *v);
  }
  if (auto v = lookup("QUEUE_POLL_INTERVAL_SECONDS"); v && !v->empty()) {
    c.queue_poll_interval_seconds = ParseIntKey("QUEUE_POLL_INTERVAL_SECONDS", *v);
  }
  if (auto v = lookup("MIN_SLOWMO_FPS"); v && !v->empty()) {
    c.min_slowmo_fps = ParseDoubleKey("MIN_SLOWMO_FPS", *v);
  }

  const fs::path source = root / "source";
  c.styles_dir = get("STYLES_DIR", (source / "videos" / "styles").string());
  c.audio_dir = get("AUDIO_DIR", (source / "audio").string());
  c.fonts_dir = get("FONTS_DIR", (source / "fonts").string());
  c.font_cache_dir = get("FONT_CACHE_DIR", (fs::path(c.fonts_dir) / "google").string());
  c.logo_dir = get("LOGO_DIR", (source / "logo").string());
  c.signature_dir = get("SIGNATURE_DIR", (source / "signature").string());
  c.outputs_dir = get("OUTPUTS_DIR", (root / "outputs").string());
  c.cache_dir = get("CACHE_DIR", (root / "cache").string());
  c.logs_dir = get("LOGS_DIR", (root / "logs").string());

  c.font_catalog_cache_file =
      get("FONT_CACHE_FILE", (fs::path(c.cache_dir) / "google_fonts_cache.json").string());
  c.video_info_cache_file =
      get("VIDEO_INFO_CACHE_FILE", (fs::path(c.cache_dir) / "video_info_cache.json").string());
  c.style_skips_file =
      get("STYLE_SKIPS_FILE", (fs::path(c.styles_dir) / "style_skips.json").string());
  c.log_file = get("LOG_FILE", (fs::path(c.logs_dir) / "clipforge.log").string());
  c.log_level = get("LOG_LEVEL", "INFO");
  c.default_font_file = get("DEFAULT_FONT", c.default_font_file);

  c.ffmpeg_bin = get("FFMPEG_BIN", c.ffmpeg_bin);
  c.ffprobe_bin = get("FFPROBE_BIN", c.ffprobe_bin);
  c.curl_bin = get("CURL_BIN", c.curl_bin);
  return c;
}

bool Config::EnsureDirectories() const {
  bool ok = true;
  for (const std::string* dir : {&styles_dir, &audio_dir, &fonts_dir, &font_cache_dir,
                                 &logo_dir, &signature_dir, &outputs_dir, &cache_dir,
                                 &logs_dir}) {
    std::error_code ec;
    fs::create_directories(*dir, ec);
    if (ec) {
      Logger::Error("[Config] Cannot create directory " + *dir + ": " + ec.message());
      ok = false;
    }
  }
  return ok;
}

std::string Config::DefaultFontPath() const {
  const fs::path p(default_font_file);
  if (p.is_absolute()) return p.string();
  return (fs::path(fonts_dir) / p).string();
}

}  // namespace clipforge::util
