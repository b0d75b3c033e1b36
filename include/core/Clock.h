// ============================================================================
// CLOCK - Injectable time source for the link scheduler
// ============================================================================
// DeviceLinkClient never calls millis()/vTaskDelay() directly: heartbeat
// deadlines and reconnect backoff go through this interface so the native
// tests can drive them with a manual clock.
// Firmware implementation: ArduinoClock (millis + vTaskDelay).
// ============================================================================

#ifndef CLOCK_H
#define CLOCK_H

#include <cstdint>

class Clock {
public:
  virtual ~Clock() = default;

  /** Monotonic milliseconds (wraps like millis()) */
  virtual uint32_t nowMs() const = 0;

  /** Block the calling task for ms milliseconds */
  virtual void sleepMs(uint32_t ms) = 0;
};

#endif // CLOCK_H
