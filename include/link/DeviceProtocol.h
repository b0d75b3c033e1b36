// ============================================================================
// DEVICE PROTOCOL - Buttplug v3 JSON frame codec
// ============================================================================
// Every frame is a JSON array of objects with exactly one key naming the
// message type:
//
//   [{"RequestServerInfo":{"Id":1,"ClientName":"Haptic Bridge","MessageVersion":3}}]
//   [{"VibrateCmd":{"Id":11,"DeviceIndex":0,"Speeds":[{"Index":0,"Speed":0.5}]}}]
//
// Inbound frames are decoded once into InboundMessage; dispatch code only
// switches on InboundKind.
// ============================================================================

#ifndef DEVICE_PROTOCOL_H
#define DEVICE_PROTOCOL_H

#include <cstdint>
#include <string>
#include <vector>
#include "link/DeviceRegistry.h"

enum class InboundKind {
  MSG_SERVER_INFO,
  MSG_OK,
  MSG_ERROR,
  MSG_DEVICE_ADDED,
  MSG_DEVICE_REMOVED,
  MSG_DEVICE_LIST,
  MSG_SCANNING_FINISHED,
  MSG_UNKNOWN
};

struct InboundMessage {
  InboundKind kind = InboundKind::MSG_UNKNOWN;
  std::string typeName;        // Wire key ("DeviceAdded", ...)
  uint32_t id = 0;             // Message "Id" (0 for server events)

  // DeviceAdded / DeviceRemoved
  Device device;

  // DeviceList
  std::vector<Device> devices;

  // ServerInfo
  std::string serverName;

  // Error, or decode problem for MSG_UNKNOWN
  std::string errorMessage;
  int errorCode = 0;
};

namespace DeviceProtocol {

// ============================================================================
// OUTBOUND
// ============================================================================

std::string encodeHandshake(const std::string& clientName);
std::string encodeRequestDeviceList();
std::string encodeStartScanning();

/** VibrateCmd, single motor (Index 0) */
std::string encodeVibrate(uint32_t messageId, int deviceIndex, float speed);

/** LinearCmd, single axis (Index 0), always Id 0 */
std::string encodeStroke(int deviceIndex, float position, uint32_t durationMs);

// ============================================================================
// INBOUND
// ============================================================================

/**
 * Decode one text frame
 * @param out Receives one InboundMessage per array element
 * @param errorMsg Set when the frame is not valid JSON or not an array/object
 * @return false for a malformed frame (nothing appended)
 */
bool decodeFrame(const std::string& frame, std::vector<InboundMessage>& out, std::string& errorMsg);

const char* kindName(InboundKind kind);

} // namespace DeviceProtocol

#endif // DEVICE_PROTOCOL_H
