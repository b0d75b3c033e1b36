// ============================================================================
// WS LINK TRANSPORT IMPLEMENTATION
// ============================================================================

#include "link/WsLinkTransport.h"
#include "link/LinkUrl.h"
#include "core/logger/Logger.h"

WsLinkTransport::WsLinkTransport()
  : _mutex(xSemaphoreCreateMutex()),
    _connected(false),
    _closed(false) {}

WsLinkTransport::~WsLinkTransport() {
  close();
  if (_mutex) vSemaphoreDelete(_mutex);
}

// ============================================================================
// OPEN
// ============================================================================

bool WsLinkTransport::open(const std::string& url, uint32_t timeoutMs) {
  if (!_mutex) return false;

  LinkEndpoint endpoint;
  std::string errorMsg;
  if (!parseLinkUrl(url, endpoint, errorMsg)) {
    Log.error("❌ " + errorMsg);
    return false;
  }

  xSemaphoreTake(_mutex, portMAX_DELAY);
  _client.onEvent([this](WStype_t type, uint8_t* payload, size_t length) {
    onEvent(type, payload, length);
  });
  // Empty protocol: no Sec-WebSocket-Protocol header
  if (endpoint.secure) {
    _client.beginSSL(endpoint.host.c_str(), endpoint.port, endpoint.path.c_str(), "", "");
  } else {
    _client.begin(endpoint.host.c_str(), endpoint.port, endpoint.path.c_str(), "");
  }
  _client.setReconnectInterval(timeoutMs);
  xSemaphoreGive(_mutex);

  uint32_t startMs = millis();
  while (millis() - startMs < timeoutMs) {
    xSemaphoreTake(_mutex, portMAX_DELAY);
    _client.loop();
    xSemaphoreGive(_mutex);

    if (_connected) return true;
    vTaskDelay(pdMS_TO_TICKS(WS_PUMP_INTERVAL_MS));
  }
  return false;
}

// ============================================================================
// SEND / RECEIVE
// ============================================================================

bool WsLinkTransport::send(const std::string& frame) {
  if (!isOpen()) return false;

  xSemaphoreTake(_mutex, portMAX_DELAY);
  bool ok = _client.sendTXT(frame.c_str(), frame.size());
  xSemaphoreGive(_mutex);
  return ok;
}

ReceiveStatus WsLinkTransport::receive(std::string& frame, uint32_t timeoutMs) {
  uint32_t startMs = millis();

  while (true) {
    xSemaphoreTake(_mutex, portMAX_DELAY);
    _client.loop();
    if (!_inbox.empty()) {
      frame = std::move(_inbox.front());
      _inbox.pop_front();
      xSemaphoreGive(_mutex);
      return ReceiveStatus::RECV_MESSAGE;
    }
    xSemaphoreGive(_mutex);

    if (_closed) return ReceiveStatus::RECV_CLOSED;
    if (millis() - startMs >= timeoutMs) return ReceiveStatus::RECV_TIMEOUT;
    vTaskDelay(pdMS_TO_TICKS(WS_PUMP_INTERVAL_MS));
  }
}

bool WsLinkTransport::ping() {
  if (!isOpen()) return false;

  xSemaphoreTake(_mutex, portMAX_DELAY);
  bool ok = _client.isConnected() && _client.sendPing();
  xSemaphoreGive(_mutex);
  return ok;
}

void WsLinkTransport::close() {
  if (!_mutex || _closed.exchange(true)) return;

  xSemaphoreTake(_mutex, portMAX_DELAY);
  _client.disconnect();
  _inbox.clear();
  xSemaphoreGive(_mutex);
}

// ============================================================================
// EVENT CALLBACK (runs inside _client.loop(), mutex already held)
// ============================================================================

void WsLinkTransport::onEvent(WStype_t type, uint8_t* payload, size_t length) {
  switch (type) {
    case WStype_CONNECTED:
      _connected = true;
      break;

    case WStype_DISCONNECTED:
      if (_connected) _closed = true;
      break;

    case WStype_ERROR:
      _closed = true;
      break;

    case WStype_TEXT:
      if (_inbox.size() >= WS_INBOX_CAPACITY) {
        _inbox.pop_front();
        Log.warn("⚠️ Link inbox full - oldest frame dropped");
      }
      _inbox.emplace_back(reinterpret_cast<const char*>(payload), length);
      break;

    default:
      break;
  }
}
