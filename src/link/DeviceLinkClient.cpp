// ============================================================================
// DEVICE LINK CLIENT IMPLEMENTATION
// ============================================================================

#include "link/DeviceLinkClient.h"
#include "core/logger/Logger.h"
#include <algorithm>

using enum LinkState;

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

DeviceLinkClient::DeviceLinkClient(TransportFactory factory, Clock& clock, std::string url,
                                   std::string clientName, LinkTiming timing)
  : _factory(std::move(factory)),
    _clock(clock),
    _url(std::move(url)),
    _clientName(std::move(clientName)),
    _timing(timing),
    _generation(0),
    _state(LINK_DISCONNECTED),
    _messageId(MSG_ID_COUNTER_START),
    _lastHeartbeatMs(0),
    _listenerArmed(false),
    _shutdown(false) {}

DeviceLinkClient::~DeviceLinkClient() {
  shutdown();
}

// ============================================================================
// CONNECTION
// ============================================================================

bool DeviceLinkClient::connect() {
  std::lock_guard<std::mutex> connectLock(_connectMutex);
  if (_shutdown) return false;

  // A concurrent caller may have connected while we waited for the lock
  if (isReady() && currentSession().transport) return true;

  setState(LINK_CONNECTING);
  Log.info("🔌 Connecting to device server: " + _url);

  std::shared_ptr<LinkTransport> transport = _factory ? _factory() : nullptr;
  if (!transport) {
    Log.error("❌ No transport available for " + _url);
    setState(LINK_DISCONNECTED);
    return false;
  }

  if (!transport->open(_url, _timing.connectTimeoutMs)) {
    Log.warn("⏱️ Device server unreachable (timeout " + std::to_string(_timing.connectTimeoutMs) +
             " ms) - is Intiface running?");
    transport->close();
    setState(LINK_DISCONNECTED);
    return false;
  }

  setState(LINK_HANDSHAKING);
  if (!transport->send(DeviceProtocol::encodeHandshake(_clientName)) ||
      !transport->send(DeviceProtocol::encodeRequestDeviceList())) {
    Log.error("❌ Handshake send failed");
    transport->close();
    setState(LINK_DISCONNECTED);
    return false;
  }

  if (!awaitServerInfo(*transport)) {
    transport->close();
    setState(LINK_DISCONNECTED);
    return false;
  }

  installSession(std::move(transport));
  _listenerArmed = true;
  Log.info("✅ Connected to device server (session " + std::to_string(sessionGeneration()) + ")");
  return true;
}

bool DeviceLinkClient::awaitServerInfo(LinkTransport& transport) {
  const uint32_t startMs = _clock.nowMs();

  while (true) {
    uint32_t elapsed = _clock.nowMs() - startMs;
    if (elapsed >= _timing.connectTimeoutMs) break;

    std::string frame;
    ReceiveStatus status = transport.receive(frame, _timing.connectTimeoutMs - elapsed);
    if (status == ReceiveStatus::RECV_CLOSED) {
      Log.warn("⚠️ Device server closed the connection during handshake");
      return false;
    }
    if (status == ReceiveStatus::RECV_TIMEOUT) break;

    std::vector<InboundMessage> messages;
    std::string errorMsg;
    if (!DeviceProtocol::decodeFrame(frame, messages, errorMsg)) {
      Log.warn("⚠️ Dropped malformed frame during handshake: " + errorMsg);
      continue;
    }

    bool serverInfoSeen = false;
    for (const auto& msg : messages) {
      if (msg.kind == InboundKind::MSG_SERVER_INFO) {
        Log.info("🤝 Handshake complete: " + (msg.serverName.empty() ? std::string("server") : msg.serverName));
        serverInfoSeen = true;
      } else if (msg.kind == InboundKind::MSG_ERROR && msg.id == MSG_ID_HANDSHAKE) {
        Log.error("❌ Handshake rejected: " + msg.errorMessage);
        return false;
      } else {
        dispatch(msg);
      }
    }
    if (serverInfoSeen) return true;
  }

  Log.warn("⏱️ Handshake timeout (" + std::to_string(_timing.connectTimeoutMs) + " ms)");
  return false;
}

void DeviceLinkClient::installSession(std::shared_ptr<LinkTransport> transport) {
  std::shared_ptr<LinkTransport> previous;
  {
    std::lock_guard<std::mutex> lock(_transportMutex);
    previous = std::move(_transport);
    _transport = std::move(transport);
    _generation++;
    _lastHeartbeatMs = _clock.nowMs();
    setState(LINK_READY);
  }

  if (previous) {
    std::lock_guard<std::mutex> sendLock(_sendMutex);
    previous->close();
  }
}

void DeviceLinkClient::dropSession(uint32_t generation, const char* reason) {
  std::shared_ptr<LinkTransport> dropped;
  {
    std::lock_guard<std::mutex> lock(_transportMutex);
    if (generation != _generation || !_transport) return;  // Stale session
    dropped = std::move(_transport);
    _transport.reset();
    setState(LINK_DISCONNECTED);
  }
  Log.warn(std::string("🔌 Device link dropped: ") + reason);

  std::lock_guard<std::mutex> sendLock(_sendMutex);
  dropped->close();
}

void DeviceLinkClient::shutdown() {
  if (_shutdown.exchange(true)) return;
  _listenerArmed = false;

  // Wait for an in-flight connect() before releasing the transport
  std::lock_guard<std::mutex> connectLock(_connectMutex);

  std::shared_ptr<LinkTransport> closing;
  {
    std::lock_guard<std::mutex> lock(_transportMutex);
    closing = std::move(_transport);
    _transport.reset();
    _generation++;
    setState(LINK_DISCONNECTED);
  }
  if (closing) {
    std::lock_guard<std::mutex> sendLock(_sendMutex);
    closing->close();
  }
  Log.info("🛑 Device link shut down");
}

// ============================================================================
// COMMANDS
// ============================================================================

void DeviceLinkClient::scanDevices() {
  if (!isReady()) return;

  Session session = currentSession();
  if (!session.transport) return;

  if (sendFrame(session, DeviceProtocol::encodeStartScanning())) {
    Log.info("🔍 Started device scanning");
  }
}

void DeviceLinkClient::vibrate(int deviceId, float strength) {
  if (_shutdown) return;

  Session session = currentSession();
  if (!_registry.contains(deviceId)) {
    Log.debug("Vibrate ignored: unknown device " + std::to_string(deviceId));
    return;
  }

  if (!session.transport) {
    Log.info("🔄 No device link - reconnecting on demand...");
    if (!connect()) return;
    session = currentSession();
    if (!session.transport || !_registry.contains(deviceId)) return;
  }

  // Ids are allocated under the send lock so they reach the wire in order
  uint32_t id;
  bool sent;
  {
    std::lock_guard<std::mutex> sendLock(_sendMutex);
    id = ++_messageId;
    sent = session.transport->send(DeviceProtocol::encodeVibrate(id, deviceId, strength));
  }
  if (!sent) {
    dropSession(session.generation, "send failed");
    return;
  }
  if (Log.isDebugEnabled()) {
    Log.debug("Vibrate device=" + std::to_string(deviceId) + " strength=" + std::to_string(strength) +
              " id=" + std::to_string(id));
  }
}

void DeviceLinkClient::stroke(int deviceId, float position, uint32_t durationMs) {
  if (!isReady() || !_registry.contains(deviceId)) return;

  Session session = currentSession();
  if (!session.transport) return;

  sendFrame(session, DeviceProtocol::encodeStroke(deviceId, position, durationMs));
}

bool DeviceLinkClient::sendFrame(const Session& session, const std::string& frame) {
  bool sent;
  {
    std::lock_guard<std::mutex> sendLock(_sendMutex);
    sent = session.transport->send(frame);
  }
  if (!sent) {
    dropSession(session.generation, "send failed");
  }
  return sent;
}

// ============================================================================
// LISTENER
// ============================================================================

bool DeviceLinkClient::listenOnce() {
  if (_shutdown) return false;

  if (!_listenerArmed) {
    // No session was ever established: nothing to listen to yet
    _clock.sleepMs(_timing.idleSliceMs);
    return true;
  }

  Session session = currentSession();
  if (!session.transport) {
    reconnectWithBackoff();
    return !_shutdown;
  }

  std::string frame;
  switch (session.transport->receive(frame, _timing.pollTimeoutMs)) {
    case ReceiveStatus::RECV_MESSAGE:
      handleFrame(frame);
      break;
    case ReceiveStatus::RECV_TIMEOUT:
      break;
    case ReceiveStatus::RECV_CLOSED:
      dropSession(session.generation, "connection closed by server");
      reconnectWithBackoff();
      break;
  }
  return !_shutdown;
}

void DeviceLinkClient::reconnectWithBackoff() {
  {
    std::lock_guard<std::mutex> lock(_transportMutex);
    if (_transport) return;  // Reconnected on demand by a command
    setState(LINK_RECONNECTING);
  }
  Log.info("🔄 Reconnecting in " + std::to_string(_timing.reconnectBackoffMs) + " ms...");
  _clock.sleepMs(_timing.reconnectBackoffMs);

  if (_shutdown) return;

  if (!connect()) {
    Log.warn("⚠️ Reconnect failed - next attempt in " + std::to_string(_timing.reconnectBackoffMs) + " ms");
  }
}

void DeviceLinkClient::handleFrame(const std::string& frame) {
  std::vector<InboundMessage> messages;
  std::string errorMsg;
  if (!DeviceProtocol::decodeFrame(frame, messages, errorMsg)) {
    Log.warn("⚠️ Dropped malformed frame: " + errorMsg);
    return;
  }
  for (const auto& msg : messages) {
    dispatch(msg);
  }
}

void DeviceLinkClient::dispatch(const InboundMessage& msg) {
  using enum InboundKind;
  switch (msg.kind) {
    case MSG_DEVICE_ADDED:
      _registry.upsert(msg.device);
      Log.info("📳 Device added: " + msg.device.name + " (ID: " + std::to_string(msg.device.id) + ")");
      break;

    case MSG_DEVICE_REMOVED:
      if (_registry.remove(msg.device.id)) {
        Log.info("📴 Device removed (ID: " + std::to_string(msg.device.id) + ")");
      }
      break;

    case MSG_DEVICE_LIST:
      _registry.upsertAll(msg.devices);
      for (const auto& device : msg.devices) {
        Log.info("📳 Found existing device: " + device.name + " (ID: " + std::to_string(device.id) + ")");
      }
      break;

    case MSG_ERROR:
      Log.warn("⚠️ Server error " + std::to_string(msg.errorCode) + " (id " + std::to_string(msg.id) +
               "): " + msg.errorMessage);
      break;

    case MSG_UNKNOWN:
      if (!msg.errorMessage.empty()) {
        Log.warn("⚠️ Dropped invalid message: " + msg.errorMessage);
      } else {
        Log.debug("Ignored message type: " + msg.typeName);
      }
      break;

    case MSG_SERVER_INFO:
    case MSG_OK:
    case MSG_SCANNING_FINISHED:
      Log.debug(std::string("Received ") + DeviceProtocol::kindName(msg.kind));
      break;
  }
}

// ============================================================================
// HEARTBEAT
// ============================================================================

bool DeviceLinkClient::heartbeatOnce() {
  if (_shutdown) return false;

  Session session = currentSession();
  if (!isReady() || !session.transport) {
    _clock.sleepMs(_timing.idleSliceMs);
    return !_shutdown;
  }

  uint32_t now = _clock.nowMs();
  uint32_t elapsed = now - _lastHeartbeatMs.load();
  if (elapsed < _timing.heartbeatIntervalMs) {
    _clock.sleepMs(std::min(_timing.idleSliceMs, _timing.heartbeatIntervalMs - elapsed));
    return !_shutdown;
  }

  bool alive;
  {
    std::lock_guard<std::mutex> sendLock(_sendMutex);
    alive = session.transport->ping();
  }
  _lastHeartbeatMs = now;

  if (alive) {
    Log.debug("Sent heartbeat ping");
  } else {
    // Reconnection stays with the listener
    dropSession(session.generation, "heartbeat failed");
  }
  return !_shutdown;
}

// ============================================================================
// HELPERS
// ============================================================================

DeviceLinkClient::Session DeviceLinkClient::currentSession() const {
  std::lock_guard<std::mutex> lock(_transportMutex);
  return Session{_transport, _generation};
}

uint32_t DeviceLinkClient::sessionGeneration() const {
  std::lock_guard<std::mutex> lock(_transportMutex);
  return _generation;
}

void DeviceLinkClient::setState(LinkState state) {
  LinkState previous = _state.exchange(state);
  if (previous != state && Log.isDebugEnabled()) {
    Log.debug(std::string("Link state: ") + linkStateName(previous) + " → " + linkStateName(state));
  }
}
