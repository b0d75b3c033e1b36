// ============================================================================
// LINK TRANSPORT - Message transport to the device-control server
// ============================================================================
// One instance per connection attempt: DeviceLinkClient asks its factory for
// a fresh transport on every connect() and never reopens a closed one.
// Firmware implementation: WsLinkTransport (links2004 WebSocketsClient).
// ============================================================================

#ifndef LINK_TRANSPORT_H
#define LINK_TRANSPORT_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

enum class ReceiveStatus {
  RECV_MESSAGE,   // frame holds one text frame
  RECV_TIMEOUT,   // nothing arrived within the timeout
  RECV_CLOSED     // peer closed or transport failed
};

class LinkTransport {
public:
  virtual ~LinkTransport() = default;

  /** Open connection, blocking at most timeoutMs */
  virtual bool open(const std::string& url, uint32_t timeoutMs) = 0;

  /** Send one text frame. @return false if the frame could not be written */
  virtual bool send(const std::string& frame) = 0;

  /** Wait up to timeoutMs for the next inbound text frame */
  virtual ReceiveStatus receive(std::string& frame, uint32_t timeoutMs) = 0;

  /** Transport-level keepalive (WebSocket ping) */
  virtual bool ping() = 0;

  virtual bool isOpen() const = 0;

  virtual void close() = 0;
};

using TransportFactory = std::function<std::shared_ptr<LinkTransport>()>;

#endif // LINK_TRANSPORT_H
