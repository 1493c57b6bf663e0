// Repository: ClipForge-render
// Component: Font Resolver
// Purpose: Family name → font file, single-flight across worker processes.
// Copyright (c) 2025 ClipForge

#include "clipforge/render/FontResolver.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

#include "clipforge/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipforge::render {

namespace {

constexpr const char* kWebfontsUrl = "https://www.googleapis.com/webfonts/v1/webfonts?key=";

bool FileExists(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

// Removes the lock marker on scope exit.
class LockMarker {
 public:
  explicit LockMarker(std::string path) : path_(std::move(path)) {}
  ~LockMarker() {
    std::error_code ec;
    if (fs::remove(path_, ec)) {
      util::Logger::Info("[FontResolver] Released lock " + path_);
    }
  }

  LockMarker(const LockMarker&) = delete;
  LockMarker& operator=(const LockMarker&) = delete;

 private:
  std::string path_;
};

bool TryCreateMarker(const std::string& path) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
  if (fd < 0) return false;
  ::close(fd);
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// CurlFontFetcher
// ---------------------------------------------------------------------------

CurlFontFetcher::CurlFontFetcher(const util::ProcessRunner& runner, std::string curl_bin)
    : runner_(runner), curl_bin_(std::move(curl_bin)) {}

std::optional<FontCatalog> CurlFontFetcher::FetchCatalog(const std::string& api_key) {
  const util::ProcessResult result =
      runner_.Run({curl_bin_, "-sS", "-f", "-L", std::string(kWebfontsUrl) + api_key});
  if (!result.Succeeded()) {
    util::Logger::Error("[FontResolver] Could not fetch font list from Google Fonts API: " +
                        result.stderr_text);
    return std::nullopt;
  }
  return ParseFontCatalogResponse(result.stdout_text);
}

bool CurlFontFetcher::Download(const std::string& url, const std::string& dest_path) {
  const util::ProcessResult result =
      runner_.Run({curl_bin_, "-sS", "-f", "-L", "-o", dest_path, url});
  if (!result.Succeeded()) {
    util::Logger::Error("[FontResolver] Could not download font file " + url + ": " +
                        result.stderr_text);
    std::error_code ec;
    fs::remove(dest_path, ec);
    return false;
  }
  return true;
}

std::optional<FontCatalog> ParseFontCatalogResponse(const std::string& body) {
  const nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

  FontCatalog catalog;
  const auto items = doc.find("items");
  if (items == doc.end() || !items->is_array()) return catalog;
  for (const auto& item : *items) {
    if (!item.is_object()) continue;
    const auto family = item.find("family");
    const auto files = item.find("files");
    if (family == item.end() || !family->is_string()) continue;
    if (files == item.end() || !files->is_object()) continue;
    auto& entry = catalog[family->get<std::string>()];
    for (const auto& [variant, url] : files->items()) {
      if (url.is_string()) entry[variant] = url.get<std::string>();
    }
  }
  return catalog;
}

// ---------------------------------------------------------------------------
// FontResolver
// ---------------------------------------------------------------------------

FontResolver::FontResolver(FontResolverOptions options, FontFetcher& fetcher)
    : options_(std::move(options)), fetcher_(fetcher) {}

std::string FontResolver::NormalizeFontFileName(const std::string& family) {
  std::string lower = family;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower.size() >= 4 && lower.compare(lower.size() - 4, 4, ".ttf") == 0) {
    return family;
  }
  return family + ".ttf";
}

std::string FontResolver::Resolve(const std::string& family) {
  const std::string file_name = NormalizeFontFileName(family);
  const std::string cached_path = (fs::path(options_.cache_dir) / file_name).string();
  if (FileExists(cached_path)) return cached_path;

  const std::string local_path = (fs::path(options_.fonts_dir) / file_name).string();
  if (FileExists(local_path)) return local_path;

  std::error_code ec;
  fs::create_directories(options_.cache_dir, ec);

  const std::string lock_path = cached_path + ".lock";
  const auto deadline = std::chrono::steady_clock::now() + options_.lock_timeout;
  while (true) {
    if (!FileExists(lock_path)) {
      if (FileExists(cached_path)) return cached_path;
      if (TryCreateMarker(lock_path)) break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      util::Logger::Warn("[FontResolver] Timed out waiting for font lock: " + file_name +
                         ". Falling back to default.");
      return options_.fallback_font;
    }
    util::Logger::Debug("[FontResolver] Waiting for lock on " + file_name + "...");
    std::this_thread::sleep_for(options_.lock_poll_interval);
  }

  LockMarker marker(lock_path);
  util::Logger::Info("[FontResolver] Acquired lock for " + file_name + ".");
  return ResolveLocked(family, file_name, cached_path);
}

std::string FontResolver::ResolveLocked(const std::string& family, const std::string& file_name,
                                        const std::string& cached_path) {
  // A previous holder may have finished between our wait and our acquire.
  if (FileExists(cached_path)) return cached_path;

  if (options_.api_key.empty()) {
    util::Logger::Warn("[FontResolver] Font '" + family +
                       "' not found locally and no Google Fonts API key is set. "
                       "Falling back to default.");
    return options_.fallback_font;
  }

  util::Logger::Info("[FontResolver] Font '" + family +
                     "' not found locally. Searching Google Fonts...");
  const std::optional<FontCatalog> catalog = LoadCatalog();
  if (!catalog) return options_.fallback_font;

  const auto entry = catalog->find(family);
  if (entry == catalog->end()) {
    util::Logger::Warn("[FontResolver] Font '" + family +
                       "' not found in Google Fonts directory.");
    return options_.fallback_font;
  }

  std::string url;
  const auto regular = entry->second.find("regular");
  if (regular != entry->second.end()) {
    url = regular->second;
  } else if (!entry->second.empty()) {
    url = entry->second.begin()->second;
  }
  if (url.empty()) {
    util::Logger::Warn("[FontResolver] Could not find a downloadable file for font '" + family +
                       "'.");
    return options_.fallback_font;
  }

  util::Logger::Info("[FontResolver] Downloading font '" + family + "' from google fonts...");
  const std::string partial_path = cached_path + ".part";
  if (!fetcher_.Download(url, partial_path)) {
    return options_.fallback_font;
  }
  std::error_code ec;
  fs::rename(partial_path, cached_path, ec);
  if (ec) {
    util::Logger::Error("[FontResolver] Could not move downloaded font into cache: " +
                        ec.message());
    fs::remove(partial_path, ec);
    return options_.fallback_font;
  }
  util::Logger::Info("[FontResolver] Successfully downloaded and saved '" + file_name +
                     "' to cache.");
  return cached_path;
}

std::optional<FontCatalog> FontResolver::LoadCatalog() {
  if (!options_.catalog_cache_file.empty() && FileExists(options_.catalog_cache_file)) {
    std::ifstream in(options_.catalog_cache_file);
    std::stringstream buffer;
    buffer << in.rdbuf();
    const nlohmann::json doc = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (!doc.is_discarded() && doc.is_object() && !doc.empty()) {
      try {
        return doc.get<FontCatalog>();
      } catch (const nlohmann::json::exception& e) {
        util::Logger::Warn(std::string("[FontResolver] Font cache file is corrupt (") + e.what() +
                           "). Regenerating.");
      }
    } else {
      util::Logger::Warn("[FontResolver] Font cache file is corrupt. Regenerating.");
    }
  }

  std::optional<FontCatalog> catalog = fetcher_.FetchCatalog(options_.api_key);
  if (!catalog) return std::nullopt;

  if (!options_.catalog_cache_file.empty()) {
    std::error_code ec;
    fs::create_directories(fs::path(options_.catalog_cache_file).parent_path(), ec);
    std::ofstream out(options_.catalog_cache_file, std::ios::trunc);
    if (out) {
      out << nlohmann::json(*catalog).dump();
      util::Logger::Info("[FontResolver] Successfully cached the Google Fonts directory.");
    } else {
      util::Logger::Warn("[FontResolver] Could not write font catalog cache " +
                         options_.catalog_cache_file);
    }
  }
  return catalog;
}

}  // namespace clipforge::render
