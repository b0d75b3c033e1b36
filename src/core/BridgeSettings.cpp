// ============================================================================
// BRIDGE SETTINGS IMPLEMENTATION
// ============================================================================

#include "core/BridgeSettings.h"
#include "core/Validators.h"
#include "core/logger/Logger.h"
#include <ArduinoJson.h>

namespace {

bool readString(JsonVariantConst v, const char* key, std::string& out, std::string& errorMsg) {
  if (v.isNull()) return true;
  if (!v.is<const char*>()) {
    errorMsg = std::string("\"") + key + "\" must be a string";
    return false;
  }
  out = v.as<std::string>();
  return true;
}

bool readUint32(JsonVariantConst v, const char* key, uint32_t& out, std::string& errorMsg) {
  if (v.isNull()) return true;
  if (!v.is<long>() || v.as<long>() < 0) {
    errorMsg = std::string("\"") + key + "\" must be a non-negative integer";
    return false;
  }
  out = static_cast<uint32_t>(v.as<long>());
  return true;
}

} // namespace

// ============================================================================
// DEFAULTS
// ============================================================================

BridgeSettings BridgeSettings::defaults() {
  BridgeSettings s;
  s.wifiSsid = ssid;
  s.wifiPassword = password;
  s.hostname = bridgeHostname;
  return s;
}

// ============================================================================
// LOAD
// ============================================================================

bool BridgeSettings::loadFromJson(const std::string& json, std::string& errorMsg) {
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    errorMsg = std::string("Invalid settings JSON: ") + err.c_str();
    return false;
  }
  if (!doc.is<JsonObjectConst>()) {
    errorMsg = "Settings root must be an object";
    return false;
  }

  // Work on a copy: commit only if every field validates
  BridgeSettings next = *this;
  JsonObjectConst root = doc.as<JsonObjectConst>();

  JsonVariantConst wifi = root["wifi"];
  if (!wifi.isNull()) {
    if (!wifi.is<JsonObjectConst>()) {
      errorMsg = "\"wifi\" must be an object";
      return false;
    }
    if (!readString(wifi["ssid"], "wifi.ssid", next.wifiSsid, errorMsg)) return false;
    if (!readString(wifi["password"], "wifi.password", next.wifiPassword, errorMsg)) return false;
  }

  if (!readString(root["hostname"], "hostname", next.hostname, errorMsg)) return false;
  if (!Validators::hostname(next.hostname, errorMsg)) return false;

  JsonVariantConst link = root["link"];
  if (!link.isNull()) {
    if (!link.is<JsonObjectConst>()) {
      errorMsg = "\"link\" must be an object";
      return false;
    }
    if (!readString(link["url"], "link.url", next.linkUrl, errorMsg)) return false;
    if (!readString(link["client_name"], "link.client_name", next.clientName, errorMsg)) return false;
    if (!readUint32(link["heartbeat_ms"], "link.heartbeat_ms", next.timing.heartbeatIntervalMs, errorMsg)) return false;
    if (!readUint32(link["reconnect_backoff_ms"], "link.reconnect_backoff_ms", next.timing.reconnectBackoffMs, errorMsg)) return false;
  }
  if (!Validators::linkUrl(next.linkUrl, errorMsg)) return false;
  if (!Validators::clientName(next.clientName, errorMsg)) return false;
  if (!Validators::intervalMs("link.heartbeat_ms", next.timing.heartbeatIntervalMs,
                              MIN_HEARTBEAT_INTERVAL_MS, MAX_HEARTBEAT_INTERVAL_MS, errorMsg)) return false;
  if (!Validators::intervalMs("link.reconnect_backoff_ms", next.timing.reconnectBackoffMs,
                              MIN_RECONNECT_BACKOFF_MS, MAX_RECONNECT_BACKOFF_MS, errorMsg)) return false;

  JsonVariantConst scale = root["intensity_scale"];
  if (!scale.isNull()) {
    if (!scale.is<float>()) {
      errorMsg = "\"intensity_scale\" must be a number";
      return false;
    }
    next.intensityScale = scale.as<float>();
  }
  if (!Validators::intensityScale(next.intensityScale, errorMsg)) return false;

  if (!readString(root["cache_dir"], "cache_dir", next.cacheDir, errorMsg)) return false;
  if (!Validators::cacheDir(next.cacheDir, errorMsg)) return false;

  JsonVariantConst port = root["events_port"];
  if (!port.isNull()) {
    if (!port.is<long>()) {
      errorMsg = "\"events_port\" must be an integer";
      return false;
    }
    if (!Validators::port(port.as<long>(), errorMsg)) return false;
    next.eventsPort = static_cast<uint16_t>(port.as<long>());
  }

  std::string levelName;
  if (!readString(root["log_level"], "log_level", levelName, errorMsg)) return false;
  if (!levelName.empty() && !Logger::parseLevel(levelName, next.logLevel)) {
    errorMsg = "Unknown log level: \"" + levelName + "\"";
    return false;
  }

  *this = next;
  return true;
}

// ============================================================================
// SERIALIZE
// ============================================================================

std::string BridgeSettings::toJson() const {
  JsonDocument doc;
  doc["wifi"]["ssid"] = wifiSsid;
  doc["hostname"] = hostname;
  doc["link"]["url"] = linkUrl;
  doc["link"]["client_name"] = clientName;
  doc["link"]["heartbeat_ms"] = timing.heartbeatIntervalMs;
  doc["link"]["reconnect_backoff_ms"] = timing.reconnectBackoffMs;
  doc["intensity_scale"] = intensityScale;
  doc["cache_dir"] = cacheDir;
  doc["events_port"] = eventsPort;
  doc["log_level"] = Logger::getLevelName(logLevel);

  std::string out;
  serializeJson(doc, out);
  return out;
}
