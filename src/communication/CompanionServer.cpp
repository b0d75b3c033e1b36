/**
 * ============================================================================
 * CompanionServer.cpp - Events WebSocket Implementation
 * ============================================================================
 */

#include "communication/CompanionServer.h"
#include "communication/PlaybackEventDispatcher.h"
#include "communication/StatusBroadcaster.h"
#include "core/logger/Logger.h"
#include <string>

CompanionServer& CompanionServer::getInstance() {
    static CompanionServer instance;
    return instance;
}

void CompanionServer::begin(WebSocketsServer* ws, PlaybackEventDispatcher* events) {
    _webSocket = ws;
    _events = events;

    _webSocket->begin();
    _webSocket->onEvent([this](uint8_t num, WStype_t type, uint8_t* payload, size_t length) {
        onWebSocketEvent(num, type, payload, length);
    });
    Log.info("🔌 Companion events server started");
}

// ============================================================================
// WEBSOCKET EVENT HANDLER
// ============================================================================

void CompanionServer::onWebSocketEvent(uint8_t num, WStype_t type, uint8_t* payload, size_t length) {
    // Client connected
    if (type == WStype_CONNECTED) {
        IPAddress ip = _webSocket->remoteIP(num);
        Log.info("Companion #" + std::to_string(num) + " connected from " + ip.toString().c_str());
        Status.send();
    }

    // Client disconnected
    if (type == WStype_DISCONNECTED) {
        Log.info("Companion #" + std::to_string(num) + " disconnected");
    }

    // Text message received
    if (type == WStype_TEXT) {
        std::string message(reinterpret_cast<const char*>(payload), length);
        std::string reply = _events->handleFrame(message);
        _webSocket->sendTXT(num, reply.c_str(), reply.size());
    }
}
