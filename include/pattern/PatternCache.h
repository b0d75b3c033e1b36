// ============================================================================
// PATTERN CACHE - Download, convert and cache scripts per video id
// ============================================================================
// Artifacts in <cacheDir> per video id:
//   <id>.json       vendor descriptor (verbatim)
//   <id>.pat        vendor pattern body (verbatim)
//   <id>.funscript  converted Script (terminal artifact)
//
// resolve() is cache-gated at every step: a terminal artifact means no
// network I/O at all, a cached descriptor or body skips that download.
// A NotFound descriptor stays cached. Any failure after the first network
// step removes all three artifacts so the next call starts from scratch.
// ============================================================================

#ifndef PATTERN_CACHE_H
#define PATTERN_CACHE_H

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include "core/Config.h"
#include "pattern/CacheStore.h"
#include "pattern/HttpFetcher.h"
#include "pattern/Script.h"

enum class ResolveStatus {
  RESOLVE_OK,
  RESOLVE_NOT_FOUND,       // Vendor has no interactive content (cacheable, not an error)
  RESOLVE_DOWNLOAD_ERROR,  // Non-200 or transport failure
  RESOLVE_INVALID_DATA,    // Descriptor/body could not be parsed
  RESOLVE_STORAGE_ERROR,   // Cache read/write failed
  RESOLVE_INVALID_ID       // Empty/unsafe id, or no id in URL
};

struct ResolveResult {
  ResolveStatus status = ResolveStatus::RESOLVE_INVALID_ID;
  std::string videoId;
  Script script;            // Valid only when status == RESOLVE_OK
  bool fromCache = false;   // Terminal artifact hit
  std::string message;

  bool ok() const { return status == ResolveStatus::RESOLVE_OK; }
};

class PatternCache {
public:
  PatternCache(HttpFetcher& http, CacheStore& store, std::string cacheDir = DEFAULT_CACHE_DIR);

  /**
   * Script for a video id, downloading and converting on a cache miss
   * @param title Stored in script metadata when converted now
   * @param durationMs Stored in script metadata when converted now
   */
  ResolveResult resolve(const std::string& videoId, const std::string& title = "", int64_t durationMs = 0);

  /** extractId() + resolve(); RESOLVE_INVALID_ID when the URL has no id */
  ResolveResult resolveUrl(const std::string& url, const std::string& title = "", int64_t durationMs = 0);

  /** Terminal artifact only, never touches the network */
  ResolveResult loadCached(const std::string& videoId);

  static std::optional<std::string> extractId(const std::string& url);

  static const char* statusName(ResolveStatus status);

  std::string descriptorPath(const std::string& videoId) const;
  std::string bodyPath(const std::string& videoId) const;
  std::string scriptPath(const std::string& videoId) const;
  const std::string& cacheDir() const { return _cacheDir; }

private:
  HttpFetcher& _http;
  CacheStore& _store;
  const std::string _cacheDir;
  std::mutex _resolveMutex;   // One resolve at a time: no two writers per id

  bool readCachedScript(const std::string& videoId, Script& out);
  ResolveStatus loadOrFetch(const std::string& url, const std::string& path, const char* what,
                            std::string& body, std::string& errorMsg);
  ResolveResult fail(ResolveResult result, ResolveStatus status, const std::string& message);
  void removeArtifacts(const std::string& videoId);
};

#endif // PATTERN_CACHE_H
