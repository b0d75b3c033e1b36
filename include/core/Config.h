// ============================================================================
// CONFIG.H - System Configuration (WiFi, Link, Vendor Endpoint, Cache)
// ============================================================================
// Compile-time defaults for every tunable of the bridge.
// Runtime overrides come from /config.json (see BridgeSettings.h).
// ============================================================================

#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>  // For size_t
#include <cstdint>  // For uint16_t, uint32_t

// ============================================================================
// CONFIGURATION - WiFi (extern declarations - defined in Config.cpp)
// ============================================================================
extern const char* ssid;
extern const char* password;
extern const char* bridgeHostname;  // Also used for mDNS (http://haptic-bridge.local)

// ============================================================================
// CONFIGURATION - Device-Control Server (Buttplug / Intiface)
// ============================================================================
constexpr const char* DEFAULT_LINK_URL = "ws://192.168.1.10:12345";
constexpr const char* DEFAULT_CLIENT_NAME = "Haptic Bridge";
constexpr int PROTOCOL_MESSAGE_VERSION = 3;

// Reserved message ids
constexpr uint32_t MSG_ID_SYSTEM = 0;          // LinearCmd and other system messages
constexpr uint32_t MSG_ID_HANDSHAKE = 1;
constexpr uint32_t MSG_ID_DEVICE_LIST = 2;
constexpr uint32_t MSG_ID_START_SCANNING = 3;
constexpr uint32_t MSG_ID_COUNTER_START = 10;  // First VibrateCmd uses 11

// ============================================================================
// CONFIGURATION - Link Timing
// ============================================================================
constexpr uint32_t LINK_CONNECT_TIMEOUT_MS = 5000;       // Transport open + handshake reply
constexpr uint32_t LINK_POLL_TIMEOUT_MS = 1000;          // Listener receive poll
constexpr uint32_t LINK_HEARTBEAT_INTERVAL_MS = 30000;   // Protocol ping while Ready
constexpr uint32_t LINK_RECONNECT_BACKOFF_MS = 2000;     // Wait before listener reconnect
constexpr uint32_t LINK_IDLE_SLICE_MS = 50;              // Listener/heartbeat idle wait

// ============================================================================
// CONFIGURATION - Command Router
// ============================================================================
constexpr float DEFAULT_INTENSITY_SCALE = 1.0f;
constexpr float MAX_INTENSITY_SCALE = 4.0f;
constexpr float PLAY_BASE_STRENGTH = 0.2f;
constexpr float UNKNOWN_SCENE_STRENGTH = 0.5f;
constexpr float AUDIO_LEVEL_GAIN = 0.8f;

// ============================================================================
// CONFIGURATION - Vendor Pattern Endpoint
// ============================================================================
constexpr const char* PATTERN_DESCRIPTOR_URL =
    "https://coll.lovense.com/coll-log/video-websites/get/pattern?videoId=";
constexpr const char* PATTERN_PARTNER_TAG = "&pf=Adulttime";
constexpr uint32_t HTTP_TIMEOUT_MS = 10000;
constexpr int HTTP_STATUS_OK = 200;

// Raw percent → script position (16 → 100)
constexpr double PATTERN_POSITION_FACTOR = 6.25;

// ============================================================================
// CONFIGURATION - Script Cache (LittleFS)
// ============================================================================
constexpr const char* DEFAULT_CACHE_DIR = "/cache";
constexpr const char* CACHE_EXT_DESCRIPTOR = ".json";
constexpr const char* CACHE_EXT_BODY = ".pat";
constexpr const char* CACHE_EXT_SCRIPT = ".funscript";
constexpr const char* CACHE_TMP_SUFFIX = ".tmp";
constexpr size_t MAX_VIDEO_ID_LENGTH = 32;
constexpr size_t MAX_CACHE_FILE_BYTES = 512 * 1024;

constexpr const char* SCRIPT_CREATOR = "Haptic Bridge";
constexpr const char* SCRIPT_DESCRIPTION = "Auto-downloaded from Lovense";
constexpr const char* SCRIPT_NOTES = "Converted from Lovense to Funscript";
constexpr const char* SCRIPT_LICENSE = "Open";

// ============================================================================
// CONFIGURATION - Companion Endpoint & Status
// ============================================================================
constexpr uint16_t DEFAULT_EVENTS_PORT = 81;
constexpr unsigned long STATUS_BROADCAST_INTERVAL_MS = 2000;
constexpr const char* SETTINGS_FILE_PATH = "/config.json";
constexpr size_t MAX_SETTINGS_FILE_BYTES = 8 * 1024;

// ============================================================================
// CONFIGURATION - Logging
// ============================================================================
constexpr int LOG_BUFFER_SIZE = 100;
constexpr unsigned long LOG_FLUSH_INTERVAL_MS = 5000;
constexpr float LOG_FORCE_FLUSH_PERCENT = 80.0f;
constexpr size_t LOG_BROADCAST_QUEUE_SIZE = 32;   // Lines waiting for the network task

// ============================================================================
// CONFIGURATION - WiFi Connection
// ============================================================================
constexpr int WIFI_CONNECT_ATTEMPTS = 60;        // × 500ms = 30s
constexpr unsigned long WIFI_ATTEMPT_DELAY_MS = 500;

// ============================================================================
// CONFIGURATION - FreeRTOS Tasks
// ============================================================================
constexpr uint32_t LISTENER_TASK_STACK = 8192;
constexpr uint32_t HEARTBEAT_TASK_STACK = 4096;
constexpr uint32_t NETWORK_TASK_STACK = 16384;  // TLS handshake for pattern downloads

#endif // CONFIG_H
