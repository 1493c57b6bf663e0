// Repository: ClipForge-render
// Component: Source Video Probe
// Purpose: ffprobe-backed source metadata with a persistent per-path cache.
// Copyright (c) 2025 ClipForge

#include "clipforge/media/VideoProbe.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "clipforge/util/Logger.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace clipforge::media {

namespace {

double NumberField(const json& obj, const char* key) {
  const auto it = obj.find(key);
  if (it == obj.end()) return 0.0;
  if (it->is_number()) return it->get<double>();
  if (it->is_string()) return std::strtod(it->get<std::string>().c_str(), nullptr);
  return 0.0;
}

json ToJson(const VideoInfo& info) {
  return json{{"duration", info.duration_s},
              {"width", info.width},
              {"height", info.height},
              {"fps", info.fps}};
}

std::optional<VideoInfo> FromJson(const json& obj) {
  if (!obj.is_object()) return std::nullopt;
  VideoInfo info;
  info.duration_s = NumberField(obj, "duration");
  info.width = static_cast<int>(NumberField(obj, "width"));
  info.height = static_cast<int>(NumberField(obj, "height"));
  info.fps = NumberField(obj, "fps");
  return info;
}

std::string AbsolutePath(const std::string& path) {
  std::error_code ec;
  const fs::path abs = fs::absolute(path, ec);
  return ec ? path : abs.lexically_normal().string();
}

}  // namespace

double ParseFrameRate(const std::string& text) {
  const auto slash = text.find('/');
  if (slash == std::string::npos) {
    return std::strtod(text.c_str(), nullptr);
  }
  const double num = std::strtod(text.substr(0, slash).c_str(), nullptr);
  const double den = std::strtod(text.substr(slash + 1).c_str(), nullptr);
  if (den == 0.0) return 0.0;
  return num / den;
}

std::optional<VideoInfo> ParseFfprobeOutput(const std::string& json_text) {
  const json doc = json::parse(json_text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

  const auto streams = doc.find("streams");
  if (streams == doc.end() || !streams->is_array()) return std::nullopt;

  for (const auto& stream : *streams) {
    if (!stream.is_object() || stream.value("codec_type", "") != "video") continue;
    VideoInfo info;
    info.duration_s = NumberField(stream, "duration");
    info.width = static_cast<int>(NumberField(stream, "width"));
    info.height = static_cast<int>(NumberField(stream, "height"));
    info.fps = ParseFrameRate(stream.value("avg_frame_rate", "0/1"));
    return info;
  }
  return std::nullopt;
}

CachedFfprobeProber::CachedFfprobeProber(const util::ProcessRunner& runner,
                                         std::string ffprobe_bin, std::string cache_file)
    : runner_(runner), ffprobe_bin_(std::move(ffprobe_bin)), cache_file_(std::move(cache_file)) {}

std::optional<VideoInfo> CachedFfprobeProber::Probe(const std::string& path) {
  const std::string key = AbsolutePath(path);

  std::map<std::string, VideoInfo> cache = LoadCache();
  const auto hit = cache.find(key);
  if (hit != cache.end()) {
    return hit->second;
  }

  const util::ProcessResult result =
      runner_.Run({ffprobe_bin_, "-v", "quiet", "-print_format", "json", "-show_format",
                   "-show_streams", key});
  if (!result.Succeeded()) {
    util::Logger::Warn("[VideoProbe] ffprobe failed for " + key +
                       ". Stderr: " + result.stderr_text);
    return std::nullopt;
  }

  const std::optional<VideoInfo> info = ParseFfprobeOutput(result.stdout_text);
  if (!info) {
    util::Logger::Warn("[VideoProbe] No video stream in ffprobe output for " + key);
    return std::nullopt;
  }

  // Merge with whatever other workers wrote meanwhile.
  cache = LoadCache();
  cache[key] = *info;
  StoreCache(cache);
  return info;
}

std::map<std::string, VideoInfo> CachedFfprobeProber::LoadCache() const {
  std::map<std::string, VideoInfo> cache;
  std::ifstream in(cache_file_);
  if (!in) return cache;

  std::stringstream buffer;
  buffer << in.rdbuf();
  const json doc = json::parse(buffer.str(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    util::Logger::Warn("[VideoProbe] Ignoring unreadable cache file " + cache_file_);
    return cache;
  }
  for (const auto& [path, value] : doc.items()) {
    if (auto info = FromJson(value)) cache[path] = *info;
  }
  return cache;
}

void CachedFfprobeProber::StoreCache(const std::map<std::string, VideoInfo>& cache) const {
  json doc = json::object();
  for (const auto& [path, info] : cache) doc[path] = ToJson(info);

  std::error_code ec;
  fs::create_directories(fs::path(cache_file_).parent_path(), ec);
  const std::string tmp = cache_file_ + ".tmp." + std::to_string(::getpid());
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      util::Logger::Warn("[VideoProbe] Cannot write cache file " + tmp);
      return;
    }
    out << doc.dump(4);
  }
  fs::rename(tmp, cache_file_, ec);
  if (ec) {
    util::Logger::Warn("[VideoProbe] Cannot replace cache file " + cache_file_ + ": " +
                       ec.message());
    fs::remove(tmp, ec);
  }
}

}  // namespace clipforge::media
