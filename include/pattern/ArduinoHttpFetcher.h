// ============================================================================
// ARDUINO HTTP FETCHER - HttpFetcher over HTTPClient (firmware)
// ============================================================================
// https:// URLs use WiFiClientSecure without certificate pinning
// (setInsecure): the vendor endpoint is reached over TLS but unverified.
// ============================================================================

#ifndef ARDUINO_HTTP_FETCHER_H
#define ARDUINO_HTTP_FETCHER_H

#include <Arduino.h>
#include "pattern/HttpFetcher.h"

class ArduinoHttpFetcher : public HttpFetcher {
public:
  HttpResponse get(const std::string& url) override;
};

#endif // ARDUINO_HTTP_FETCHER_H
