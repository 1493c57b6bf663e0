// Repository: ClipForge-render
// Component: Font Resolver
// Purpose: Family name → font file, single-flight across worker processes.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_RENDER_FONT_RESOLVER_HPP_
#define CLIPFORGE_RENDER_FONT_RESOLVER_HPP_

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "clipforge/util/ProcessRunner.hpp"

namespace clipforge::render {

// family → (variant → download URL)
using FontCatalog = std::map<std::string, std::map<std::string, std::string>>;

// Remote font catalog access. Implementations must not throw.
class FontFetcher {
 public:
  virtual ~FontFetcher() = default;

  // Full catalog for |api_key|, or nullopt if it cannot be fetched.
  virtual std::optional<FontCatalog> FetchCatalog(const std::string& api_key) = 0;

  // Writes |url| to |dest_path|. Returns false on any failure.
  virtual bool Download(const std::string& url, const std::string& dest_path) = 0;
};

// Google Fonts Developer API via the curl CLI.
class CurlFontFetcher : public FontFetcher {
 public:
  CurlFontFetcher(const util::ProcessRunner& runner, std::string curl_bin);

  std::optional<FontCatalog> FetchCatalog(const std::string& api_key) override;
  bool Download(const std::string& url, const std::string& dest_path) override;

 private:
  const util::ProcessRunner& runner_;
  std::string curl_bin_;
};

// Parses a webfonts list response ({"items":[{"family":..,"files":{..}}]}).
// Returns nullopt on malformed JSON.
std::optional<FontCatalog> ParseFontCatalogResponse(const std::string& body);

struct FontResolverOptions {
  std::string cache_dir;           // Writable, shared by all workers
  std::string fonts_dir;           // Read-only local assets
  std::string catalog_cache_file;  // JSON family → files
  std::string api_key;             // Empty disables remote lookups
  std::string fallback_font = "arial.ttf";
  std::chrono::milliseconds lock_poll_interval{500};
  std::chrono::milliseconds lock_timeout{30000};
};

// FontResolver maps a family name to a usable font file.
//
// Lookup order:
//   1. <cache_dir>/<name>.ttf
//   2. <fonts_dir>/<name>.ttf
//   3. Under <cache_dir>/<name>.ttf.lock: re-check the cache, then download
//      from the remote catalog.
//
// Every failure (lock wait timeout, no key, missing family, fetch/download
// error) returns fallback_font. The lock marker is created exclusively and is
// always removed by the resolver that created it. The marker protocol is
// advisory; a crashed holder leaves a stale marker that waiters time out on.
class FontResolver {
 public:
  FontResolver(FontResolverOptions options, FontFetcher& fetcher);

  std::string Resolve(const std::string& family);

  // "<family>.ttf" unless |family| already ends in .ttf (case-insensitive).
  static std::string NormalizeFontFileName(const std::string& family);

 private:
  std::string ResolveLocked(const std::string& family, const std::string& file_name,
                            const std::string& cached_path);
  std::optional<FontCatalog> LoadCatalog();

  FontResolverOptions options_;
  FontFetcher& fetcher_;
};

}  // namespace clipforge::render

#endif  // CLIPFORGE_RENDER_FONT_RESOLVER_HPP_
