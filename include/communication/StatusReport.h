/**
 * ============================================================================
 * StatusReport.h - Bridge Status JSON
 * ============================================================================
 *
 * Snapshot of the device link pushed to companions:
 *
 *   {"type":"status","link_state":"ready","link_connected":true,
 *    "active_devices":1,"devices":{"0":"Lush 3"},
 *    "script_loaded":true,"video_id":"12345"}
 */

#pragma once

#include <string>

class DeviceLinkClient;

namespace StatusReport {

/** Build the status document; video_id is omitted when empty */
std::string build(const DeviceLinkClient& link, bool scriptLoaded, const std::string& videoId = "");

} // namespace StatusReport
