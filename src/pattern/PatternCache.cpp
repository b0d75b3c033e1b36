// ============================================================================
// PATTERN CACHE IMPLEMENTATION
// ============================================================================

#include "pattern/PatternCache.h"
#include "pattern/PatternConverter.h"
#include "pattern/ScriptCodec.h"
#include "pattern/VideoIdExtractor.h"
#include "core/Validators.h"
#include "core/logger/Logger.h"

using enum ResolveStatus;

PatternCache::PatternCache(HttpFetcher& http, CacheStore& store, std::string cacheDir)
  : _http(http),
    _store(store),
    _cacheDir(std::move(cacheDir)) {}

// ============================================================================
// PATHS
// ============================================================================

std::string PatternCache::descriptorPath(const std::string& videoId) const {
  return _cacheDir + "/" + videoId + CACHE_EXT_DESCRIPTOR;
}

std::string PatternCache::bodyPath(const std::string& videoId) const {
  return _cacheDir + "/" + videoId + CACHE_EXT_BODY;
}

std::string PatternCache::scriptPath(const std::string& videoId) const {
  return _cacheDir + "/" + videoId + CACHE_EXT_SCRIPT;
}

// ============================================================================
// RESOLVE
// ============================================================================

ResolveResult PatternCache::resolve(const std::string& videoId, const std::string& title, int64_t durationMs) {
  ResolveResult result;
  result.videoId = videoId;

  std::string errorMsg;
  if (!Validators::videoId(videoId, errorMsg)) {
    result.status = RESOLVE_INVALID_ID;
    result.message = errorMsg;
    Log.warn("⚠️ " + errorMsg);
    return result;
  }

  std::lock_guard<std::mutex> lock(_resolveMutex);

  // STEP 1: Terminal artifact → no network
  if (readCachedScript(videoId, result.script)) {
    Log.info("📂 Loading cached funscript for video ID " + videoId);
    result.status = RESOLVE_OK;
    result.fromCache = true;
    return result;
  }

  // STEP 2: Descriptor
  std::string descriptorBody;
  std::string descriptorUrl = std::string(PATTERN_DESCRIPTOR_URL) + videoId + PATTERN_PARTNER_TAG;
  ResolveStatus status = loadOrFetch(descriptorUrl, descriptorPath(videoId), "pattern info", descriptorBody, errorMsg);
  if (status != RESOLVE_OK) return fail(result, status, errorMsg);

  // STEP 3: Availability
  PatternDescriptor descriptor;
  if (!PatternConverter::parseDescriptor(descriptorBody, descriptor, errorMsg)) {
    return fail(result, RESOLVE_INVALID_DATA, errorMsg);
  }
  if (descriptor.code != 0) {
    Log.info("🚫 No interactive content available for video ID " + videoId);
    result.status = RESOLVE_NOT_FOUND;
    result.message = "No interactive content (code " + std::to_string(descriptor.code) + ")";
    return result;
  }
  if (descriptor.patternUrl.empty()) {
    return fail(result, RESOLVE_INVALID_DATA, "Descriptor has no pattern URL");
  }

  // STEP 4: Pattern body
  std::string patternBody;
  status = loadOrFetch(descriptor.patternUrl, bodyPath(videoId), "pattern data", patternBody, errorMsg);
  if (status != RESOLVE_OK) return fail(result, status, errorMsg);

  // STEP 5-6: Convert + stable sort
  std::vector<RawPatternAction> raw;
  if (!PatternConverter::parseBody(patternBody, raw, errorMsg)) {
    return fail(result, RESOLVE_INVALID_DATA, errorMsg);
  }
  Script script = PatternConverter::buildScript(raw, title, durationMs);

  // STEP 7: Terminal artifact
  if (!_store.writeAtomic(scriptPath(videoId), ScriptCodec::serialize(script))) {
    return fail(result, RESOLVE_STORAGE_ERROR, "Failed to write " + scriptPath(videoId));
  }

  Log.info("✅ Downloaded and converted funscript for video ID " + videoId);
  result.status = RESOLVE_OK;
  result.script = std::move(script);
  return result;
}

ResolveResult PatternCache::resolveUrl(const std::string& url, const std::string& title, int64_t durationMs) {
  std::optional<std::string> videoId = extractId(url);
  if (!videoId) {
    ResolveResult result;
    result.status = RESOLVE_INVALID_ID;
    result.message = "Could not extract video ID from URL";
    Log.warn("⚠️ Could not extract video ID from URL: " + url);
    return result;
  }
  Log.info("🔎 Extracted video ID " + *videoId + " from URL");
  return resolve(*videoId, title, durationMs);
}

ResolveResult PatternCache::loadCached(const std::string& videoId) {
  ResolveResult result;
  result.videoId = videoId;

  std::string errorMsg;
  if (!Validators::videoId(videoId, errorMsg)) {
    result.status = RESOLVE_INVALID_ID;
    result.message = errorMsg;
    return result;
  }

  std::lock_guard<std::mutex> lock(_resolveMutex);
  if (!readCachedScript(videoId, result.script)) {
    result.status = RESOLVE_NOT_FOUND;
    result.message = "Funscript not found in cache";
    return result;
  }
  result.status = RESOLVE_OK;
  result.fromCache = true;
  return result;
}

std::optional<std::string> PatternCache::extractId(const std::string& url) {
  return VideoIdExtractor::extractId(url);
}

const char* PatternCache::statusName(ResolveStatus status) {
  switch (status) {
    case RESOLVE_OK:             return "ok";
    case RESOLVE_NOT_FOUND:      return "not_found";
    case RESOLVE_DOWNLOAD_ERROR: return "download_error";
    case RESOLVE_INVALID_DATA:   return "invalid_data";
    case RESOLVE_STORAGE_ERROR:  return "storage_error";
    case RESOLVE_INVALID_ID:     return "invalid_id";
  }
  return "unknown";
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

bool PatternCache::readCachedScript(const std::string& videoId, Script& out) {
  const std::string path = scriptPath(videoId);
  if (!_store.exists(path)) return false;

  std::string json;
  std::string errorMsg;
  if (!_store.read(path, json)) {
    Log.error("❌ Error loading cached funscript: cannot read " + path);
    return false;
  }
  if (!ScriptCodec::parse(json, out, errorMsg)) {
    Log.error("❌ Error loading cached funscript: " + errorMsg);
    return false;
  }
  return true;
}

ResolveStatus PatternCache::loadOrFetch(const std::string& url, const std::string& path, const char* what,
                                        std::string& body, std::string& errorMsg) {
  if (_store.exists(path)) {
    if (!_store.read(path, body)) {
      errorMsg = "Failed to read cached " + std::string(what) + ": " + path;
      return RESOLVE_STORAGE_ERROR;
    }
    return RESOLVE_OK;
  }

  HttpResponse response = _http.get(url);
  if (response.status != HTTP_STATUS_OK) {
    errorMsg = "Failed to download " + std::string(what) + ": " +
               (response.status > 0 ? "HTTP " + std::to_string(response.status) : response.error);
    return RESOLVE_DOWNLOAD_ERROR;
  }

  if (!_store.writeAtomic(path, response.body)) {
    errorMsg = "Failed to write " + path;
    return RESOLVE_STORAGE_ERROR;
  }
  body = std::move(response.body);
  return RESOLVE_OK;
}

ResolveResult PatternCache::fail(ResolveResult result, ResolveStatus status, const std::string& message) {
  Log.error("❌ Error downloading funscript for video ID " + result.videoId + ": " + message);
  removeArtifacts(result.videoId);

  result.status = status;
  result.message = message;
  result.script = Script();
  return result;
}

void PatternCache::removeArtifacts(const std::string& videoId) {
  for (const std::string& path : {descriptorPath(videoId), bodyPath(videoId), scriptPath(videoId)}) {
    if (_store.exists(path) && !_store.remove(path)) {
      Log.warn("⚠️ Could not remove cache file " + path);
    }
  }
}
