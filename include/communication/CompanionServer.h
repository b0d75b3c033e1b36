/**
 * ============================================================================
 * CompanionServer.h - Events WebSocket for the Browser Companion
 * ============================================================================
 *
 * Owns the WebSocketsServer event callback. Text frames are handed to
 * PlaybackEventDispatcher and the reply goes back to the sending client.
 */

#pragma once

#include <Arduino.h>
#include <WebSocketsServer.h>

class PlaybackEventDispatcher;

class CompanionServer {
public:
    static CompanionServer& getInstance();

    /** Register the event handler and start listening */
    void begin(WebSocketsServer* ws, PlaybackEventDispatcher* events);

    void onWebSocketEvent(uint8_t num, WStype_t type, uint8_t* payload, size_t length);

private:
    CompanionServer() = default;
    CompanionServer(const CompanionServer&) = delete;
    CompanionServer& operator=(const CompanionServer&) = delete;

    WebSocketsServer* _webSocket = nullptr;
    PlaybackEventDispatcher* _events = nullptr;
};

// Global accessor
#define Companion CompanionServer::getInstance()
