/**
 * NetworkManager.h - WiFi Station, mDNS & NTP
 *
 * The bridge runs as a WiFi station only. Once connected it advertises the
 * companion events WebSocket over mDNS (ws://<hostname>.local:<port>) and
 * starts NTP so log files get real timestamps.
 */

#pragma once

#include <Arduino.h>
#include <WiFi.h>
#include <ESPmDNS.h>
#include <string>
#include "core/BridgeSettings.h"

class NetworkManager {
public:
    static NetworkManager& getInstance();

    /**
     * Connect to WiFi and start mDNS + NTP
     * @return true if the station is connected
     */
    bool begin(const BridgeSettings& settings);

    bool isConnected() const { return WiFi.status() == WL_CONNECTED; }

    std::string getIPAddress() const;
    const std::string& getHostname() const { return _hostname; }

private:
    NetworkManager() = default;
    NetworkManager(const NetworkManager&) = delete;
    NetworkManager& operator=(const NetworkManager&) = delete;

    bool connectWiFi(const BridgeSettings& settings);
    bool setupMDNS(uint16_t eventsPort);
    void setupNTP();

    bool _wifiConnected = false;
    std::string _hostname;
};

// Global access macro
#define Network NetworkManager::getInstance()
