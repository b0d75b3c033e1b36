/**
 * NetworkManager.cpp - WiFi, mDNS, NTP Implementation
 */

#include "communication/NetworkManager.h"
#include "core/Config.h"
#include "core/TimeUtils.h"
#include "core/logger/Logger.h"

// ============================================================================
// SINGLETON INSTANCE
// ============================================================================

NetworkManager& NetworkManager::getInstance() {
    static NetworkManager instance;
    return instance;
}

// ============================================================================
// WIFI CONNECTION
// ============================================================================

bool NetworkManager::connectWiFi(const BridgeSettings& settings) {
    WiFi.mode(WIFI_STA);
    WiFi.setHostname(settings.hostname.c_str());
    WiFi.begin(settings.wifiSsid.c_str(), settings.wifiPassword.c_str());

    Log.info("📶 Connecting to WiFi: " + settings.wifiSsid);

    int attempts = 0;
    while (WiFi.status() != WL_CONNECTED && attempts < WIFI_CONNECT_ATTEMPTS) {
        delay(WIFI_ATTEMPT_DELAY_MS);
        Serial.print(".");
        attempts++;

        if (attempts % 10 == 0) {
            Log.info("[" + std::to_string(attempts) + "/" + std::to_string(WIFI_CONNECT_ATTEMPTS) +
                     "] WiFi connecting...");
        }
    }
    Serial.println();

    _wifiConnected = (WiFi.status() == WL_CONNECTED);

    if (_wifiConnected) {
        Log.info("✅ WiFi connected!");
        Log.info("🌐 IP Address: " + getIPAddress());
    } else {
        Log.error("❌ WiFi connection failed!");
    }
    return _wifiConnected;
}

std::string NetworkManager::getIPAddress() const {
    return WiFi.localIP().toString().c_str();
}

// ============================================================================
// MDNS SETUP
// ============================================================================

bool NetworkManager::setupMDNS(uint16_t eventsPort) {
    if (!_wifiConnected) return false;

    if (MDNS.begin(_hostname.c_str())) {
        Log.info("✅ mDNS responder started: ws://" + _hostname + ".local:" + std::to_string(eventsPort));
        MDNS.addService("ws", "tcp", eventsPort);
        return true;
    } else {
        Log.error("❌ Error starting mDNS responder");
        return false;
    }
}

// ============================================================================
// NTP TIME SYNC
// ============================================================================

void NetworkManager::setupNTP() {
    if (!_wifiConnected) return;

    // UTC, no daylight saving
    configTime(0, 0, "pool.ntp.org", "time.nist.gov");
    Log.info("⏰ NTP time configured (UTC)");

    // Wait a bit for time sync
    delay(1000);
    if (TimeUtils::isSynchronized()) {
        Log.info("✓ Time synchronized: " + TimeUtils::format("%Y-%m-%d %H:%M:%S"));
    }
}

// ============================================================================
// FULL INITIALIZATION
// ============================================================================

bool NetworkManager::begin(const BridgeSettings& settings) {
    _hostname = settings.hostname;

    bool connected = connectWiFi(settings);
    if (connected) {
        setupMDNS(settings.eventsPort);
        setupNTP();
        Log.info("✅ Network ready (STA + mDNS + NTP)");
    } else {
        Log.warn("⚠️ Network unavailable: device link and pattern downloads will retry later");
    }
    return connected;
}
