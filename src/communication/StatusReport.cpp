/**
 * ============================================================================
 * StatusReport.cpp - Bridge Status JSON Implementation
 * ============================================================================
 */

#include "communication/StatusReport.h"
#include "link/DeviceLinkClient.h"
#include <ArduinoJson.h>

namespace StatusReport {

std::string build(const DeviceLinkClient& link, bool scriptLoaded, const std::string& videoId) {
    JsonDocument doc;

    doc["type"] = "status";
    doc["link_state"] = linkStateName(link.state());
    doc["link_connected"] = link.isReady();

    std::vector<Device> devices = link.devices();
    doc["active_devices"] = devices.size();

    // Device indices become object keys
    JsonObject deviceObj = doc["devices"].to<JsonObject>();
    for (const auto& device : devices) {
        deviceObj[std::to_string(device.id)] = device.name;
    }

    doc["script_loaded"] = scriptLoaded;
    if (!videoId.empty()) {
        doc["video_id"] = videoId;
    }

    std::string output;
    serializeJson(doc, output);
    return output;
}

} // namespace StatusReport
