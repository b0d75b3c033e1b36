// ============================================================================
// BRIDGE SETTINGS - Runtime configuration (/config.json)
// ============================================================================
// Compile-time defaults come from Config.h / Config.cpp. /config.json on
// LittleFS may override any of them:
//
//   {
//     "wifi":     { "ssid": "...", "password": "..." },
//     "hostname": "haptic-bridge",
//     "link":     { "url": "ws://192.168.1.10:12345", "client_name": "Haptic Bridge",
//                   "heartbeat_ms": 30000, "reconnect_backoff_ms": 2000 },
//     "intensity_scale": 1.0,
//     "cache_dir": "/cache",
//     "events_port": 81,
//     "log_level": "info"
//   }
//
// Every value goes through Validators. A file with one invalid value is
// rejected as a whole and the current settings are left untouched.
// ============================================================================

#ifndef BRIDGE_SETTINGS_H
#define BRIDGE_SETTINGS_H

#include <cstdint>
#include <string>
#include "core/Config.h"
#include "core/Types.h"

// Accepted ranges for timing overrides
constexpr uint32_t MIN_HEARTBEAT_INTERVAL_MS = 1000;
constexpr uint32_t MAX_HEARTBEAT_INTERVAL_MS = 300000;
constexpr uint32_t MIN_RECONNECT_BACKOFF_MS = 100;
constexpr uint32_t MAX_RECONNECT_BACKOFF_MS = 60000;

struct BridgeSettings {
  std::string wifiSsid;
  std::string wifiPassword;
  std::string hostname;

  std::string linkUrl = DEFAULT_LINK_URL;
  std::string clientName = DEFAULT_CLIENT_NAME;
  LinkTiming timing;

  float intensityScale = DEFAULT_INTENSITY_SCALE;
  std::string cacheDir = DEFAULT_CACHE_DIR;
  uint16_t eventsPort = DEFAULT_EVENTS_PORT;
  LogLevel logLevel = LogLevel::LOG_INFO;

  /** Defaults from Config.h plus the WiFi credentials of Config.cpp */
  static BridgeSettings defaults();

  /**
   * Apply overrides from a JSON document
   * @param json Contents of /config.json
   * @param errorMsg First parse or validation error
   * @return false if the document is rejected (settings unchanged)
   */
  bool loadFromJson(const std::string& json, std::string& errorMsg);

  /** Serialize current values (same layout as /config.json, password omitted) */
  std::string toJson() const;
};

#endif // BRIDGE_SETTINGS_H
