// ============================================================================
// DEVICE PROTOCOL IMPLEMENTATION
// ============================================================================

#include "link/DeviceProtocol.h"
#include "core/Config.h"
#include <ArduinoJson.h>
#include <cstring>

namespace {

std::string serializeFrame(const JsonDocument& doc) {
  std::string out;
  serializeJson(doc, out);
  return out;
}

bool decodeDevice(JsonObjectConst obj, Device& out) {
  if (!obj["DeviceIndex"].is<int>()) return false;
  out.id = obj["DeviceIndex"].as<int>();
  out.name = obj["DeviceName"] | "";
  out.rawDescriptor.clear();
  serializeJson(obj, out.rawDescriptor);
  return true;
}

InboundKind kindFromKey(const char* key) {
  using enum InboundKind;
  if (strcmp(key, "ServerInfo") == 0)       return MSG_SERVER_INFO;
  if (strcmp(key, "Ok") == 0)               return MSG_OK;
  if (strcmp(key, "Error") == 0)            return MSG_ERROR;
  if (strcmp(key, "DeviceAdded") == 0)      return MSG_DEVICE_ADDED;
  if (strcmp(key, "DeviceRemoved") == 0)    return MSG_DEVICE_REMOVED;
  if (strcmp(key, "DeviceList") == 0)       return MSG_DEVICE_LIST;
  if (strcmp(key, "ScanningFinished") == 0) return MSG_SCANNING_FINISHED;
  return MSG_UNKNOWN;
}

InboundMessage decodeEntry(JsonVariantConst entry) {
  using enum InboundKind;
  InboundMessage msg;

  JsonObjectConst wrapper = entry.as<JsonObjectConst>();
  if (wrapper.isNull() || wrapper.size() != 1) {
    msg.errorMessage = "entry must be an object with one key";
    return msg;
  }

  JsonPairConst pair = *wrapper.begin();
  msg.typeName = pair.key().c_str();
  JsonObjectConst body = pair.value().as<JsonObjectConst>();
  if (body.isNull()) {
    msg.errorMessage = msg.typeName + " body is not an object";
    return msg;
  }

  msg.id = body["Id"] | 0u;
  InboundKind kind = kindFromKey(msg.typeName.c_str());

  switch (kind) {
    case MSG_SERVER_INFO:
      msg.serverName = body["ServerName"] | "";
      break;

    case MSG_ERROR:
      msg.errorMessage = body["ErrorMessage"] | "";
      msg.errorCode = body["ErrorCode"] | 0;
      break;

    case MSG_DEVICE_ADDED:
    case MSG_DEVICE_REMOVED:
      if (!decodeDevice(body, msg.device)) {
        msg.errorMessage = msg.typeName + " without integer DeviceIndex";
        return msg;  // stays MSG_UNKNOWN
      }
      break;

    case MSG_DEVICE_LIST: {
      JsonArrayConst list = body["Devices"].as<JsonArrayConst>();
      if (list.isNull()) {
        msg.errorMessage = "DeviceList without Devices array";
        return msg;
      }
      for (JsonVariantConst item : list) {
        Device device;
        if (decodeDevice(item.as<JsonObjectConst>(), device)) {
          msg.devices.push_back(std::move(device));
        }
      }
      break;
    }

    case MSG_OK:
    case MSG_SCANNING_FINISHED:
    case MSG_UNKNOWN:
      break;
  }

  msg.kind = kind;
  return msg;
}

} // namespace

namespace DeviceProtocol {

// ============================================================================
// OUTBOUND
// ============================================================================

std::string encodeHandshake(const std::string& clientName) {
  JsonDocument doc;
  JsonObject msg = doc.add<JsonObject>()["RequestServerInfo"].to<JsonObject>();
  msg["Id"] = MSG_ID_HANDSHAKE;
  msg["ClientName"] = clientName;
  msg["MessageVersion"] = PROTOCOL_MESSAGE_VERSION;
  return serializeFrame(doc);
}

std::string encodeRequestDeviceList() {
  JsonDocument doc;
  doc.add<JsonObject>()["RequestDeviceList"]["Id"] = MSG_ID_DEVICE_LIST;
  return serializeFrame(doc);
}

std::string encodeStartScanning() {
  JsonDocument doc;
  doc.add<JsonObject>()["StartScanning"]["Id"] = MSG_ID_START_SCANNING;
  return serializeFrame(doc);
}

std::string encodeVibrate(uint32_t messageId, int deviceIndex, float speed) {
  JsonDocument doc;
  JsonObject msg = doc.add<JsonObject>()["VibrateCmd"].to<JsonObject>();
  msg["Id"] = messageId;
  msg["DeviceIndex"] = deviceIndex;
  JsonObject motor = msg["Speeds"].to<JsonArray>().add<JsonObject>();
  motor["Index"] = 0;
  motor["Speed"] = speed;
  return serializeFrame(doc);
}

std::string encodeStroke(int deviceIndex, float position, uint32_t durationMs) {
  JsonDocument doc;
  JsonObject msg = doc.add<JsonObject>()["LinearCmd"].to<JsonObject>();
  msg["Id"] = MSG_ID_SYSTEM;
  msg["DeviceIndex"] = deviceIndex;
  JsonObject axis = msg["Vectors"].to<JsonArray>().add<JsonObject>();
  axis["Index"] = 0;
  axis["Duration"] = durationMs;
  axis["Position"] = position;
  return serializeFrame(doc);
}

// ============================================================================
// INBOUND
// ============================================================================

bool decodeFrame(const std::string& frame, std::vector<InboundMessage>& out, std::string& errorMsg) {
  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, frame);
  if (err) {
    errorMsg = std::string("JSON error: ") + err.c_str();
    return false;
  }

  if (doc.is<JsonArrayConst>()) {
    for (JsonVariantConst entry : doc.as<JsonArrayConst>()) {
      out.push_back(decodeEntry(entry));
    }
    return true;
  }

  // Tolerate a bare object from non-conforming servers
  if (doc.is<JsonObjectConst>()) {
    out.push_back(decodeEntry(doc.as<JsonVariantConst>()));
    return true;
  }

  errorMsg = "Frame is neither an array nor an object";
  return false;
}

const char* kindName(InboundKind kind) {
  using enum InboundKind;
  switch (kind) {
    case MSG_SERVER_INFO:       return "ServerInfo";
    case MSG_OK:                return "Ok";
    case MSG_ERROR:             return "Error";
    case MSG_DEVICE_ADDED:      return "DeviceAdded";
    case MSG_DEVICE_REMOVED:    return "DeviceRemoved";
    case MSG_DEVICE_LIST:       return "DeviceList";
    case MSG_SCANNING_FINISHED: return "ScanningFinished";
    case MSG_UNKNOWN:           return "Unknown";
  }
  return "Unknown";
}

} // namespace DeviceProtocol
