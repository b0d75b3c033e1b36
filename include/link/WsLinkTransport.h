// ============================================================================
// WS LINK TRANSPORT - LinkTransport over links2004 WebSocketsClient
// ============================================================================
// WebSocketsClient is not thread-safe and only makes progress inside
// loop(). Every client call (loop, sendTXT, sendPing, disconnect) runs
// under one FreeRTOS mutex; inbound text frames are queued by the event
// callback and handed out by receive().
// ============================================================================

#ifndef WS_LINK_TRANSPORT_H
#define WS_LINK_TRANSPORT_H

#include <Arduino.h>
#include <WebSocketsClient.h>
#include <atomic>
#include <deque>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "link/LinkTransport.h"

constexpr size_t WS_INBOX_CAPACITY = 32;
constexpr uint32_t WS_PUMP_INTERVAL_MS = 10;

class WsLinkTransport : public LinkTransport {
public:
  WsLinkTransport();
  ~WsLinkTransport() override;

  bool open(const std::string& url, uint32_t timeoutMs) override;
  bool send(const std::string& frame) override;
  ReceiveStatus receive(std::string& frame, uint32_t timeoutMs) override;
  bool ping() override;
  bool isOpen() const override { return _connected.load() && !_closed.load(); }
  void close() override;

private:
  WebSocketsClient _client;
  SemaphoreHandle_t _mutex;
  std::deque<std::string> _inbox;   // guarded by _mutex
  std::atomic<bool> _connected;
  std::atomic<bool> _closed;

  void onEvent(WStype_t type, uint8_t* payload, size_t length);
};

#endif // WS_LINK_TRANSPORT_H
