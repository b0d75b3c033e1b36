// ============================================================================
// ARDUINO CLOCK - Clock backed by millis() / vTaskDelay()
// ============================================================================

#ifndef ARDUINO_CLOCK_H
#define ARDUINO_CLOCK_H

#include <Arduino.h>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "core/Clock.h"

class ArduinoClock : public Clock {
public:
  uint32_t nowMs() const override { return millis(); }

  void sleepMs(uint32_t ms) override {
    vTaskDelay(pdMS_TO_TICKS(ms > 0 ? ms : 1));
  }
};

#endif // ARDUINO_CLOCK_H
