// ============================================================================
// TYPES.H - Data Structures and Enums
// ============================================================================
// Shared enums and small value structs used across the bridge modules.
// Everything here is plain C++ so the native test build can include it.
// ============================================================================
//
// LINK STATE MACHINE:
// ═══════════════════════════════════════════════════════════════════════════
//
//   LINK_DISCONNECTED → LINK_CONNECTING → LINK_HANDSHAKING → LINK_READY
//          ^                  |                 |                |
//          |                  +-----(fail)------+                |
//          |                                        (heartbeat failure,
//          |                                         transport closed)
//          |                                                     v
//          +---(reconnect failed)--- LINK_RECONNECTING <--- LINK_DISCONNECTED
//
//   Only LINK_READY accepts scan/stroke commands. Vibrate may trigger an
//   on-demand connect() from LINK_DISCONNECTED.
// ═══════════════════════════════════════════════════════════════════════════

#ifndef TYPES_H
#define TYPES_H

#include <cstdint>
#include "core/Config.h"

// ============================================================================
// LINK STATE
// ============================================================================

enum class LinkState {
  LINK_DISCONNECTED,
  LINK_CONNECTING,
  LINK_HANDSHAKING,
  LINK_READY,
  LINK_RECONNECTING
};

inline const char* linkStateName(LinkState state) {
  using enum LinkState;
  switch (state) {
    case LINK_DISCONNECTED: return "disconnected";
    case LINK_CONNECTING:   return "connecting";
    case LINK_HANDSHAKING:  return "handshaking";
    case LINK_READY:        return "ready";
    case LINK_RECONNECTING: return "reconnecting";
  }
  return "unknown";
}

// ============================================================================
// LOG LEVEL
// ============================================================================

enum class LogLevel : int {
  LOG_ERROR = 0,
  LOG_WARNING = 1,
  LOG_INFO = 2,
  LOG_DEBUG = 3
};

// ============================================================================
// LINK TIMING (injected into DeviceLinkClient by BridgeSettings)
// ============================================================================

struct LinkTiming {
  uint32_t connectTimeoutMs = LINK_CONNECT_TIMEOUT_MS;
  uint32_t pollTimeoutMs = LINK_POLL_TIMEOUT_MS;
  uint32_t heartbeatIntervalMs = LINK_HEARTBEAT_INTERVAL_MS;
  uint32_t reconnectBackoffMs = LINK_RECONNECT_BACKOFF_MS;
  uint32_t idleSliceMs = LINK_IDLE_SLICE_MS;
};

#endif // TYPES_H
