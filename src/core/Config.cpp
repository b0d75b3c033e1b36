// ============================================================================
// CONFIG.CPP - Configuration Variable Definitions
// ============================================================================
// Definitions for extern variables declared in Config.h
// This file must be compiled once to avoid multiple definition errors
// ============================================================================

#include "core/Config.h"

// ============================================================================
// WIFI CREDENTIALS (overridden by /config.json when present)
// ============================================================================
const char* ssid = "your_ssid";
const char* password = "your_password";

// ============================================================================
// HOSTNAME
// ============================================================================
const char* bridgeHostname = "haptic-bridge";  // Also used for mDNS (http://haptic-bridge.local)
