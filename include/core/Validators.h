// ============================================================================
// VALIDATORS - Centralized Parameter Validation
// ============================================================================
// Purpose: All validation functions in one place for cleaner code
// - Link endpoint and timing
// - Intensity scale
// - Companion port, hostname
// - Cache directory and video ids (used as file names)
//
// Usage: Include this header and use Validators namespace
//   #include "core/Validators.h"
//   std::string err;
//   if (!Validators::intensityScale(2.5f, err)) { Log.error(err); }
// ============================================================================

#ifndef VALIDATORS_H
#define VALIDATORS_H

#include <cctype>
#include <cstdint>
#include <string>
#include "core/Config.h"
#include "link/LinkUrl.h"

namespace Validators {

// ============================================================================
// LINK VALIDATORS
// ============================================================================

/**
 * Validate device-control server URL (ws:// or wss:// with a host)
 * @param url URL to validate
 * @param errorMsg Output error message if validation fails
 * @return true if valid, false otherwise
 */
inline bool linkUrl(const std::string& url, std::string& errorMsg) {
  LinkEndpoint endpoint;
  return parseLinkUrl(url, endpoint, errorMsg);
}

/**
 * Validate a millisecond interval against [minMs, maxMs]
 * @param name Parameter name used in the error message
 */
inline bool intervalMs(const char* name, uint32_t value, uint32_t minMs, uint32_t maxMs,
                       std::string& errorMsg) {
  if (value < minMs || value > maxMs) {
    errorMsg = std::string(name) + " out of range: " + std::to_string(value) +
               " ms (allowed " + std::to_string(minMs) + "-" + std::to_string(maxMs) + " ms)";
    return false;
  }
  return true;
}

inline bool clientName(const std::string& name, std::string& errorMsg) {
  if (name.empty()) {
    errorMsg = "Client name must not be empty";
    return false;
  }
  return true;
}

// ============================================================================
// ROUTER VALIDATORS
// ============================================================================

/**
 * Validate intensity scale (0 < scale <= MAX_INTENSITY_SCALE)
 */
inline bool intensityScale(float scale, std::string& errorMsg) {
  if (!(scale > 0.0f)) {
    errorMsg = "Intensity scale must be positive: " + std::to_string(scale);
    return false;
  }
  if (scale > MAX_INTENSITY_SCALE) {
    errorMsg = "Intensity scale too high: " + std::to_string(scale) +
               " (max: " + std::to_string(MAX_INTENSITY_SCALE) + ")";
    return false;
  }
  return true;
}

// ============================================================================
// NETWORK VALIDATORS
// ============================================================================

inline bool port(long value, std::string& errorMsg) {
  if (value < 1 || value > 65535) {
    errorMsg = "Port out of range: " + std::to_string(value);
    return false;
  }
  return true;
}

/**
 * Validate mDNS hostname (1-63 chars, letters, digits and '-', no leading '-')
 */
inline bool hostname(const std::string& name, std::string& errorMsg) {
  if (name.empty() || name.size() > 63) {
    errorMsg = "Hostname length must be 1-63: \"" + name + "\"";
    return false;
  }
  if (name.front() == '-') {
    errorMsg = "Hostname must not start with '-': \"" + name + "\"";
    return false;
  }
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
      errorMsg = "Invalid character in hostname: \"" + name + "\"";
      return false;
    }
  }
  return true;
}

// ============================================================================
// CACHE VALIDATORS
// ============================================================================

/**
 * Validate cache directory (absolute, no "..", no trailing '/')
 */
inline bool cacheDir(const std::string& dir, std::string& errorMsg) {
  if (dir.size() < 2 || dir.front() != '/') {
    errorMsg = "Cache directory must be an absolute path: \"" + dir + "\"";
    return false;
  }
  if (dir.back() == '/') {
    errorMsg = "Cache directory must not end with '/': \"" + dir + "\"";
    return false;
  }
  if (dir.find("..") != std::string::npos) {
    errorMsg = "Cache directory must not contain \"..\": \"" + dir + "\"";
    return false;
  }
  return true;
}

/**
 * Validate video id before it becomes a cache file name
 * Non-empty, at most MAX_VIDEO_ID_LENGTH chars of [A-Za-z0-9_-]
 */
inline bool videoId(const std::string& id, std::string& errorMsg) {
  if (id.empty()) {
    errorMsg = "Video id is empty";
    return false;
  }
  if (id.size() > MAX_VIDEO_ID_LENGTH) {
    errorMsg = "Video id too long: " + std::to_string(id.size()) +
               " chars (max: " + std::to_string(MAX_VIDEO_ID_LENGTH) + ")";
    return false;
  }
  for (char c : id) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
      errorMsg = "Invalid character in video id: \"" + id + "\"";
      return false;
    }
  }
  return true;
}

} // namespace Validators

#endif // VALIDATORS_H
