/**
 * ============================================================================
 * StatusBroadcaster.h - WebSocket Status Broadcasting
 * ============================================================================
 *
 * Pushes StatusReport to every connected companion at a fixed interval.
 * Nothing is serialized while no client is connected.
 */

#ifndef STATUS_BROADCASTER_H
#define STATUS_BROADCASTER_H

#include <Arduino.h>
#include <WebSocketsServer.h>

class DeviceLinkClient;
class PlaybackEventDispatcher;

// ============================================================================
// STATUS BROADCASTER CLASS
// ============================================================================

class StatusBroadcaster {
public:
    // Singleton pattern
    static StatusBroadcaster& getInstance();

    /**
     * Initialize the broadcaster
     * @param ws Events server used for broadcasting
     * @param link Device link reported in each status
     * @param events Source of the active-script flag
     */
    void begin(WebSocketsServer* ws, DeviceLinkClient* link, PlaybackEventDispatcher* events);

    /** Broadcast immediately */
    void send();

    /** Broadcast if STATUS_BROADCAST_INTERVAL_MS elapsed since the last one */
    void tick();

private:
    StatusBroadcaster() = default;
    StatusBroadcaster(const StatusBroadcaster&) = delete;
    StatusBroadcaster& operator=(const StatusBroadcaster&) = delete;

    WebSocketsServer* _webSocket = nullptr;
    DeviceLinkClient* _link = nullptr;
    PlaybackEventDispatcher* _events = nullptr;
    unsigned long _lastBroadcastMs = 0;
};

// Global accessor (singleton)
extern StatusBroadcaster& Status;

#endif // STATUS_BROADCASTER_H
