// ============================================================================
// DEVICE LINK CLIENT - Self-healing connection to the device-control server
// ============================================================================
// Owns the single outbound connection (Buttplug v3 over WebSocket):
// - connect(): open + RequestServerInfo + RequestDeviceList, wait ServerInfo
// - listenOnce(): one listener iteration (receive, dispatch, reconnect)
// - heartbeatOnce(): one heartbeat iteration (ping every 30s while Ready)
// - vibrate() / stroke() / scanDevices(): outbound commands
// - device registry fed by DeviceAdded / DeviceRemoved / DeviceList
//
// Threading: the firmware runs listenOnce() and heartbeatOnce() in two
// FreeRTOS tasks; commands arrive from the network task. Rules:
// - Only connect() installs a transport. Heartbeat and failed sends only
//   drop it; the listener owns reconnection.
// - Every connect() that succeeds starts a new session generation. A
//   listener/heartbeat iteration that captured an older session never
//   touches the new one.
// - Sends are serialized by _sendMutex, connect attempts by _connectMutex.
// ============================================================================

#ifndef DEVICE_LINK_CLIENT_H
#define DEVICE_LINK_CLIENT_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/Clock.h"
#include "core/Types.h"
#include "link/DeviceProtocol.h"
#include "link/DeviceRegistry.h"
#include "link/LinkTransport.h"

class DeviceLinkClient {
public:
  DeviceLinkClient(TransportFactory factory, Clock& clock, std::string url,
                   std::string clientName, LinkTiming timing = LinkTiming());
  ~DeviceLinkClient();

  DeviceLinkClient(const DeviceLinkClient&) = delete;
  DeviceLinkClient& operator=(const DeviceLinkClient&) = delete;

  // ========================================================================
  // CONNECTION
  // ========================================================================

  /**
   * Open transport and perform the handshake (bounded by connectTimeoutMs)
   * Failure is a reported outcome: state goes back to LINK_DISCONNECTED.
   * @return true if Ready (immediately true when already Ready)
   */
  bool connect();

  /** Disarm listener + heartbeat, then close the transport. Final. */
  void shutdown();

  // ========================================================================
  // COMMANDS
  // ========================================================================

  /** StartScanning (no-op unless Ready) */
  void scanDevices();

  /**
   * VibrateCmd with the next message id
   * No-op for an unknown device. Reconnects on demand if the transport is
   * gone. Strength is sent as given: callers clamp to [0,1].
   */
  void vibrate(int deviceId, float strength);

  /** LinearCmd with id 0 (no-op unless Ready and device known) */
  void stroke(int deviceId, float position, uint32_t durationMs);

  // ========================================================================
  // SCHEDULABLE UNITS
  // ========================================================================

  /**
   * One listener iteration: wait pollTimeoutMs for a frame and dispatch it.
   * On a closed/dropped transport: backoff, then connect(). A failed
   * reconnect is retried on the next iteration, without limit.
   * @return false once shut down (task should exit)
   */
  bool listenOnce();

  /**
   * One heartbeat iteration: ping when the interval elapsed, otherwise
   * sleep one idle slice. A failed ping drops the transport.
   * @return false once shut down (task should exit)
   */
  bool heartbeatOnce();

  // ========================================================================
  // READ-ONLY STATE
  // ========================================================================

  LinkState state() const { return _state.load(); }
  bool isReady() const { return _state.load() == LinkState::LINK_READY; }
  bool isShutdown() const { return _shutdown.load(); }

  std::vector<Device> devices() const { return _registry.snapshot(); }
  std::vector<int> deviceIds() const { return _registry.ids(); }
  size_t deviceCount() const { return _registry.size(); }

  /** Last VibrateCmd id issued (MSG_ID_COUNTER_START before the first) */
  uint32_t lastMessageId() const { return _messageId.load(); }

  uint32_t sessionGeneration() const;

private:
  struct Session {
    std::shared_ptr<LinkTransport> transport;
    uint32_t generation = 0;
  };

  TransportFactory _factory;
  Clock& _clock;
  const std::string _url;
  const std::string _clientName;
  const LinkTiming _timing;

  DeviceRegistry _registry;

  mutable std::mutex _transportMutex;   // guards _transport + _generation
  std::shared_ptr<LinkTransport> _transport;
  uint32_t _generation;

  std::mutex _sendMutex;
  std::mutex _connectMutex;

  std::atomic<LinkState> _state;
  std::atomic<uint32_t> _messageId;
  std::atomic<uint32_t> _lastHeartbeatMs;
  std::atomic<bool> _listenerArmed;
  std::atomic<bool> _shutdown;

  Session currentSession() const;
  bool awaitServerInfo(LinkTransport& transport);
  void installSession(std::shared_ptr<LinkTransport> transport);
  void dropSession(uint32_t generation, const char* reason);
  bool sendFrame(const Session& session, const std::string& frame);
  void reconnectWithBackoff();
  void handleFrame(const std::string& frame);
  void dispatch(const InboundMessage& msg);
  void setState(LinkState state);
};

#endif // DEVICE_LINK_CLIENT_H
