/**
 * ============================================================================
 * StatusBroadcaster.cpp - WebSocket Status Broadcasting Implementation
 * ============================================================================
 */

#include "communication/StatusBroadcaster.h"
#include "communication/PlaybackEventDispatcher.h"
#include "communication/StatusReport.h"
#include "core/Config.h"
#include "core/logger/Logger.h"
#include "link/DeviceLinkClient.h"

// ============================================================================
// SINGLETON INSTANCE
// ============================================================================

StatusBroadcaster& StatusBroadcaster::getInstance() {
    static StatusBroadcaster instance;
    return instance;
}

// Global accessor
StatusBroadcaster& Status = StatusBroadcaster::getInstance();

// ============================================================================
// INITIALIZATION
// ============================================================================

void StatusBroadcaster::begin(WebSocketsServer* ws, DeviceLinkClient* link, PlaybackEventDispatcher* events) {
    _webSocket = ws;
    _link = link;
    _events = events;
    Log.info("StatusBroadcaster initialized");
}

// ============================================================================
// BROADCASTING
// ============================================================================

void StatusBroadcaster::send() {
    if (_webSocket == nullptr || _link == nullptr) {
        Log.debug("⚠️ sendStatus: broadcaster not initialized");
        return;
    }
    if (_webSocket->connectedClients() == 0) {
        return;
    }

    bool scriptLoaded = _events != nullptr && _events->hasActiveScript();
    std::string videoId = _events != nullptr ? _events->activeVideoId() : std::string();

    String output(StatusReport::build(*_link, scriptLoaded, videoId).c_str());
    _webSocket->broadcastTXT(output);
}

void StatusBroadcaster::tick() {
    unsigned long now = millis();
    if (now - _lastBroadcastMs < STATUS_BROADCAST_INTERVAL_MS) return;
    _lastBroadcastMs = now;
    send();
}
