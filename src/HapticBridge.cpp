// ============================================================================
// ESP32-S3 HAPTIC BRIDGE
// ============================================================================
// Bridges a browser companion (events WebSocket, port 81 by default) to a
// haptic device server speaking the JSON device-control protocol.
// Features: scene/audio intensity routing, pattern download + cache,
// script-driven playback, auto-reconnect with heartbeat
// ============================================================================

// ============================================================================
// LIBRARIES
// ============================================================================
#include <Arduino.h>
#include <WiFi.h>
#include <WebSocketsServer.h>
#include <memory>

// ============================================================================
// PROJECT HEADERS
// ============================================================================
#include "core/BridgeSettings.h"
#include "core/Config.h"
#include "core/filesystem/FileSystem.h"
#include "core/logger/Logger.h"
#include "core/logger/LogSinks.h"

#include "platform/ArduinoClock.h"

#include "link/DeviceLinkClient.h"
#include "link/WsLinkTransport.h"

#include "router/CommandRouter.h"

#include "pattern/ArduinoHttpFetcher.h"
#include "pattern/LittleFsCacheStore.h"
#include "pattern/PatternCache.h"

#include "communication/CompanionServer.h"
#include "communication/NetworkManager.h"
#include "communication/PlaybackEventDispatcher.h"
#include "communication/StatusBroadcaster.h"

// ============================================================================
// GLOBAL INSTANCES
// ============================================================================

FileSystem fileSystem;
SerialLogSink serialSink;
FileLogSink* fileSink = nullptr;
WebSocketLogSink* wsSink = nullptr;

BridgeSettings settings;
ArduinoClock systemClock;
WebSocketsServer* eventsSocket = nullptr;

DeviceLinkClient* deviceLink = nullptr;
CommandRouter* router = nullptr;
ArduinoHttpFetcher httpFetcher;
LittleFsCacheStore* cacheStore = nullptr;
PatternCache* patternCache = nullptr;
PlaybackEventDispatcher* events = nullptr;

TaskHandle_t listenerTaskHandle = NULL;
TaskHandle_t heartbeatTaskHandle = NULL;
TaskHandle_t networkTaskHandle = NULL;

void listenerTask(void* param);
void heartbeatTask(void* param);
void networkTask(void* param);

// ============================================================================
// SETTINGS
// ============================================================================

// Missing file keeps defaults, a rejected file is fatal
bool loadSettings() {
  settings = BridgeSettings::defaults();

  if (!fileSystem.fileExists(SETTINGS_FILE_PATH)) {
    Log.warn("⚠️ No " + std::string(SETTINGS_FILE_PATH) + ", using built-in defaults");
    return true;
  }

  std::string contents;
  if (!fileSystem.readFile(SETTINGS_FILE_PATH, contents, MAX_SETTINGS_FILE_BYTES)) {
    Log.error("❌ Cannot read " + std::string(SETTINGS_FILE_PATH));
    return false;
  }

  std::string errorMsg;
  if (!settings.loadFromJson(contents, errorMsg)) {
    Log.error("❌ Invalid " + std::string(SETTINGS_FILE_PATH) + ": " + errorMsg);
    return false;
  }

  Log.info("⚙️ Settings loaded: " + settings.toJson());
  return true;
}

void haltWithError(const char* reason) {
  Log.error(std::string("⛔ Startup aborted: ") + reason);
  if (fileSink) fileSink->flushLogBuffer(true);
  while (true) {
    vTaskDelay(pdMS_TO_TICKS(1000));
  }
}

// ============================================================================
// SETUP - INITIALIZATION
// ============================================================================
void setup() {
  Serial.begin(115200);
  delay(100);  // Brief pause for Serial stability

  // ============================================================================
  // 1. FILESYSTEM & LOGGING (First for early logging capability)
  // ============================================================================
  Log.addSink(&serialSink);
  if (!fileSystem.mount()) {
    Log.error("❌ LittleFS mount failed, continuing without file logging and cache");
  }

  Log.info("\n=== ESP32-S3 Haptic Bridge ===");

  // ============================================================================
  // 2. SETTINGS (/config.json)
  // ============================================================================
  if (!loadSettings()) {
    haltWithError("configuration rejected");
  }
  Log.setLogLevel(settings.logLevel);

  // ============================================================================
  // 3. NETWORK (WiFi STA + mDNS + NTP)
  // ============================================================================
  Network.begin(settings);

  if (fileSystem.isReady()) {
    fileSink = new FileLogSink(fileSystem);
    if (fileSink->initializeLogFile()) {
      Log.addSink(fileSink);
    }
  }

  // ============================================================================
  // 4. COMPONENTS
  // ============================================================================
  deviceLink = new DeviceLinkClient(
    []() { return std::make_shared<WsLinkTransport>(); },
    systemClock, settings.linkUrl, settings.clientName, settings.timing);

  router = new CommandRouter(*deviceLink, settings.intensityScale);

  cacheStore = new LittleFsCacheStore(fileSystem);
  fileSystem.createDirectory(settings.cacheDir);
  patternCache = new PatternCache(httpFetcher, *cacheStore, settings.cacheDir);

  events = new PlaybackEventDispatcher(*router, *deviceLink, *patternCache);
  Log.info("✅ Device link + router + pattern cache ready");

  // ============================================================================
  // 5. EVENTS WEBSOCKET (companion)
  // ============================================================================
  eventsSocket = new WebSocketsServer(settings.eventsPort);
  Companion.begin(eventsSocket, events);
  Status.begin(eventsSocket, deviceLink, events);

  wsSink = new WebSocketLogSink(*eventsSocket);
  Log.addSink(wsSink);
  Log.info("✅ Events WebSocket on port " + std::to_string(settings.eventsPort));

  // ============================================================================
  // 6. DEVICE SERVER (first connect arms the listener)
  // ============================================================================
  if (deviceLink->connect()) {
    deviceLink->scanDevices();
  } else {
    Log.warn("⚠️ Device server not reachable at " + settings.linkUrl + " (companion \"connect\" retries)");
  }

  // ============================================================================
  // 7. FREERTOS TASKS
  // ============================================================================
  xTaskCreatePinnedToCore(
    listenerTask,         // Task function
    "LinkListener",       // Name
    LISTENER_TASK_STACK,  // Stack size (bytes)
    NULL,                 // Parameters
    2,                    // Priority
    &listenerTaskHandle,  // Task handle
    1                     // Core 1
  );

  xTaskCreatePinnedToCore(
    heartbeatTask,
    "LinkHeartbeat",
    HEARTBEAT_TASK_STACK,
    NULL,
    1,
    &heartbeatTaskHandle,
    1
  );

  // Pattern downloads run here (TLS needs the larger stack)
  xTaskCreatePinnedToCore(
    networkTask,
    "NetworkTask",
    NETWORK_TASK_STACK,
    NULL,
    1,
    &networkTaskHandle,
    0
  );

  Log.info("\n╔════════════════════════════════════════════════════════╗");
  Log.info("║  HAPTIC BRIDGE READY                                   ║");
  Log.info("║  Events: ws://" + settings.hostname + ".local:" + std::to_string(settings.eventsPort));
  Log.info("║  Device server: " + settings.linkUrl);
  Log.info("╚════════════════════════════════════════════════════════╝\n");
}

// ============================================================================
// LINK LISTENER TASK - receive, dispatch, reconnect with backoff
// ============================================================================
void listenerTask(void* param) {
  Log.info("🎧 LinkListener started on Core " + std::to_string(xPortGetCoreID()));
  while (deviceLink->listenOnce()) {
  }
  vTaskDelete(NULL);
}

// ============================================================================
// LINK HEARTBEAT TASK - protocol ping while Ready
// ============================================================================
void heartbeatTask(void* param) {
  while (deviceLink->heartbeatOnce()) {
  }
  vTaskDelete(NULL);
}

// ============================================================================
// NETWORK TASK - events WebSocket, status broadcast, log broadcast + flush
// ============================================================================
void networkTask(void* param) {
  Log.info("🌐 NetworkTask started on Core " + std::to_string(xPortGetCoreID()));

  while (true) {
    eventsSocket->loop();
    Status.tick();

    // Log lines from the link tasks reach companion clients from here only
    if (wsSink) {
      wsSink->drain();
    }

    if (fileSink) {
      fileSink->flushLogBuffer();
    }

    vTaskDelay(pdMS_TO_TICKS(1));
  }
}

// ============================================================================
// MAIN LOOP - FreeRTOS tasks handle everything
// ============================================================================
void loop() {
  vTaskDelay(portMAX_DELAY);
}
